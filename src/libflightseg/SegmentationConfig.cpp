/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "Errors.hpp"
#include "SegmentationConfig.hpp"
#include "Timestamp.hpp"

namespace flight_seg {

namespace {

template <typename T> void readValue(const YAML::Node &section, const char *key, T &target)
{
    if (!section || !section[key]) {
        return;
    }
    try {
        target = section[key].as<T>();
    } catch (const YAML::Exception &e) {
        std::stringstream msg;
        msg << "invalid value for '" << key << "': " << e.what();
        throw ConfigError{msg.str()};
    }
}

RunConfig fromYaml(const YAML::Node &root)
{
    RunConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError{"configuration root must be a mapping"};
    }

    const YAML::Node seg = root["segmentation"];
    auto &s = config.segmentation;
    readValue(seg, "soft_gap_minutes", s.softGapMinutes);
    readValue(seg, "long_ground_gap_minutes", s.longGroundGapMinutes);
    readValue(seg, "hard_gap_hours", s.hardGapHours);
    readValue(seg, "max_jump_km", s.maxJumpKm);
    readValue(seg, "same_heading_degrees", s.sameHeadingDegrees);
    readValue(seg, "lookback_horizon_hours", s.lookbackHorizonHours);

    // read signed so that a negative count is reported instead of wrapping
    long minPoints = static_cast<long>(s.minConsecutivePoints);
    readValue(seg, "min_consecutive_points", minPoints);
    if (minPoints < 0) {
        throw ConfigError{"min_consecutive_points must not be negative"};
    }
    s.minConsecutivePoints = static_cast<std::size_t>(minPoints);

    const YAML::Node pipe = root["pipeline"];
    auto &p = config.pipeline;
    long chunkSize = static_cast<long>(p.chunkSizeFiles);
    readValue(pipe, "chunk_size_files", chunkSize);
    if (chunkSize < 1) {
        throw ConfigError{"chunk_size_files must be at least 1"};
    }
    p.chunkSizeFiles = static_cast<std::size_t>(chunkSize);
    readValue(pipe, "output_dir", p.outputDir);
    readValue(pipe, "output_prefix", p.outputPrefix);
    readValue(pipe, "flight_info_file", p.flightInfoFile);

    const YAML::Node scope = root["route_scope"];
    readValue(scope, "airports_file", p.airportsFile);
    readValue(scope, "country", p.scopeCountry);

    const YAML::Node logging = root["logging"];
    readValue(logging, "level", p.logLevel);

    config.segmentation.validate();
    config.pipeline.validate();
    return config;
}

} // namespace

void SegmentationConfig::validate() const
{
    if (!(hardGapHours > 0.0)) {
        throw ConfigError{"hard_gap_hours must be positive"};
    }
    if (!(lookbackHorizonHours > 0.0)) {
        throw ConfigError{"lookback_horizon_hours must be positive"};
    }
}

void SegmentationConfig::dump(std::ostream &outStream) const
{
    outStream << "Segmentation:" << "\n    soft_gap_minutes: " << softGapMinutes
              << "\n    long_ground_gap_minutes: " << longGroundGapMinutes << "\n    hard_gap_hours: " << hardGapHours
              << "\n    max_jump_km: " << maxJumpKm << "\n    same_heading_degrees: " << sameHeadingDegrees
              << "\n    min_consecutive_points: " << minConsecutivePoints
              << "\n    lookback_horizon_hours: " << lookbackHorizonHours << "\n";
}

Timestamp SegmentationConfig::hardGapMs() const { return hoursToMs(hardGapHours); }

Timestamp SegmentationConfig::lookbackHorizonMs() const { return hoursToMs(lookbackHorizonHours); }

Timestamp SegmentationConfig::continuationLimitMs() const { return std::min(hardGapMs(), lookbackHorizonMs()); }

void PipelineConfig::validate() const
{
    if (chunkSizeFiles == 0) {
        throw ConfigError{"chunk_size_files must be at least 1"};
    }
    if (outputPrefix.empty()) {
        throw ConfigError{"output_prefix must not be empty"};
    }
}

void PipelineConfig::dump(std::ostream &outStream) const
{
    outStream << "Pipeline:" << "\n    chunk_size_files: " << chunkSizeFiles << "\n    output_dir: " << outputDir
              << "\n    output_prefix: " << outputPrefix
              << "\n    flight_info_file: " << (flightInfoFile.empty() ? "(none)" : flightInfoFile)
              << "\n    airports_file: " << (airportsFile.empty() ? "(none)" : airportsFile)
              << "\n    country: " << scopeCountry << "\n    log_level: " << logLevel << "\n";
}

RunConfig loadRunConfig(const std::string &filename)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(filename);
    } catch (const YAML::Exception &e) {
        throw ConfigError{"Failed to parse YAML file '" + filename + "': " + e.what()};
    }
    return fromYaml(root);
}

RunConfig parseRunConfig(const std::string &yamlText)
{
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception &e) {
        throw ConfigError{std::string{"Failed to parse YAML: "} + e.what()};
    }
    return fromYaml(root);
}

} // namespace flight_seg
