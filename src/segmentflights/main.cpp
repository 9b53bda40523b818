/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Command line driver for libflightseg.
 *
 * Reads position files in the order given, segments them into flights
 * chunk by chunk and writes the day partitions.
 */

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "CommandLineParser.hpp"
#include "libflightseg/ChunkSequencer.hpp"
#include "libflightseg/Errors.hpp"
#include "libflightseg/Logging.hpp"
#include "libflightseg/SegmentationConfig.hpp"

using namespace flight_seg;

void showHelp(const char *progName)
{
    std::cout << "Usage: " << progName << " [options] input..." << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    -h, --help               print this help" << std::endl;
    std::cout << "    -c, --config <file>      YAML configuration" << std::endl;
    std::cout << "    -o, --output <dir>       output directory for the day partitions" << std::endl;
    std::cout << "    -l, --log-level <level>  trace, debug, info, warn, error, critical or off" << std::endl;
    std::cout << "    -n, --chunk-size <n>     input files per chunk" << std::endl;
    std::cout << "A directory argument stands for the .csv files in it, in name order." << std::endl;
}

std::vector<std::filesystem::path> expandInputs(const std::vector<std::string> &args)
{
    std::vector<std::filesystem::path> files;
    for (const auto &arg : args) {
        std::filesystem::path path{arg};
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            std::vector<std::filesystem::path> inDir;
            for (const auto &entry : std::filesystem::directory_iterator(path)) {
                if (entry.is_regular_file() && entry.path().extension() == PARTITION_EXTENSION) {
                    inDir.push_back(entry.path());
                }
            }
            std::sort(inDir.begin(), inDir.end());
            files.insert(files.end(), inDir.begin(), inDir.end());
        } else {
            files.push_back(path);
        }
    }
    return files;
}

std::size_t parseChunkSize(const std::string &text)
{
    size_t idx = 0;
    long value = 0;
    try {
        value = std::stol(text, &idx);
    } catch (const std::logic_error &) {
        throw ConfigError{"chunk size must be a positive integer: " + text};
    }
    if (idx != text.size() || value < 1) {
        throw ConfigError{"chunk size must be a positive integer: " + text};
    }
    return static_cast<std::size_t>(value);
}

int main(int argc, char *argv[])
{
    CommandLineParser parser;
    parser.addOption('c', "config", true);
    parser.addOption('o', "output", true);
    parser.addOption('l', "log-level", true);
    parser.addOption('n', "chunk-size", true);
    parser.addOption('h', "help", false);

    if (!parser.parse(argc, argv)) {
        showHelp(argv[0]);
        return 1;
    }
    if (parser.hasFlag("help") || parser.positional().empty()) {
        showHelp(argv[0]);
        return 0;
    }

    try {
        RunConfig config;
        if (parser.hasOption("config")) {
            config = loadRunConfig(parser.getOption("config"));
        }
        if (parser.hasOption("output")) {
            config.pipeline.outputDir = parser.getOption("output");
        }
        if (parser.hasOption("log-level")) {
            config.pipeline.logLevel = parser.getOption("log-level");
        }
        if (parser.hasOption("chunk-size")) {
            config.pipeline.chunkSizeFiles = parseChunkSize(parser.getOption("chunk-size"));
        }

        initLogging(config.pipeline.logLevel);
        if (getLogger()->should_log(spdlog::level::debug)) {
            config.segmentation.dump(std::cout);
            config.pipeline.dump(std::cout);
        }

        auto files = expandInputs(parser.positional());
        if (files.empty()) {
            FLIGHTSEG_LOG_WARN("no input files");
            return 0;
        }

        ChunkSequencer sequencer(config.segmentation, config.pipeline);
        auto summary = sequencer.run(files);
        summary.dump(std::cout);
    } catch (const SchemaError &ex) {
        std::cerr << "Schema error: " << ex.what() << std::endl;
        return 2;
    } catch (const ConfigError &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
