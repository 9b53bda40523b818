/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Tunable parameters of the segmentation engine and of the batch
 * pipeline that drives it.
 *
 * SegmentationConfig
 *      Thresholds used while turning one chunk of positions into flights.
 *      soft_gap, long_ground_gap, max_jump and same_heading are carried for
 *      completeness but not consulted by the algorithm.
 *
 * PipelineConfig
 *      Chunking, output location and route scope of a whole run.
 */

#pragma once

#include <cstddef>
#include <iostream>
#include <string>

#include "SegmentationConstants.hpp"

namespace flight_seg {

class SegmentationConfig
{
  public:
    SegmentationConfig() = default;
    virtual ~SegmentationConfig() = default;

    /// Throws ConfigError if a threshold is out of range
    void validate() const;
    void dump(std::ostream &outStream) const;

    [[nodiscard]] Timestamp hardGapMs() const;
    [[nodiscard]] Timestamp lookbackHorizonMs() const;

    /// Largest start delay after a tail's last record that still continues it
    [[nodiscard]] Timestamp continuationLimitMs() const;

  public:
    double softGapMinutes{DEFAULT_SOFT_GAP_MINUTES};
    double longGroundGapMinutes{DEFAULT_LONG_GROUND_GAP_MINUTES};
    double hardGapHours{DEFAULT_HARD_GAP_HOURS};
    double maxJumpKm{DEFAULT_MAX_JUMP_KM};
    double sameHeadingDegrees{DEFAULT_SAME_HEADING_DEGREES};
    std::size_t minConsecutivePoints{DEFAULT_MIN_CONSECUTIVE_POINTS};
    double lookbackHorizonHours{DEFAULT_LOOKBACK_HORIZON_HOURS};
};

class PipelineConfig
{
  public:
    PipelineConfig() = default;
    virtual ~PipelineConfig() = default;

    void validate() const;
    void dump(std::ostream &outStream) const;

  public:
    std::size_t chunkSizeFiles{DEFAULT_CHUNK_SIZE_FILES};
    std::string outputDir{DEFAULT_OUTPUT_DIR};
    std::string outputPrefix{DEFAULT_OUTPUT_PREFIX};
    std::string flightInfoFile; // empty: not written
    std::string airportsFile;   // empty: every route is in scope
    std::string scopeCountry{DEFAULT_SCOPE_COUNTRY};
    std::string logLevel{DEFAULT_LOG_LEVEL};
};

struct RunConfig {
    SegmentationConfig segmentation;
    PipelineConfig pipeline;
};

/**
 * Load a YAML configuration file. Keys that are absent keep their defaults.
 *
 * @throws ConfigError if the file can't be parsed or a value is invalid
 */
[[nodiscard]] RunConfig loadRunConfig(const std::string &filename);

/// Same as loadRunConfig() but from YAML text
[[nodiscard]] RunConfig parseRunConfig(const std::string &yamlText);

} // namespace flight_seg
