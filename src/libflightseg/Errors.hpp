/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Exception types raised by libflightseg.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace flight_seg {

/**
 * A file is missing required columns, or its header doesn't match the
 * dataset it is being merged into. Always fatal for the run.
 */
class SchemaError : public std::runtime_error
{
  public:
    explicit SchemaError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * The configuration couldn't be read or holds an out-of-range value.
 */
class ConfigError : public std::invalid_argument
{
  public:
    explicit ConfigError(const std::string &what) : std::invalid_argument(what) {}
};

} // namespace flight_seg
