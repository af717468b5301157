#pragma once

/**
 * @file converter_config.hpp
 * @brief Settings for an image -> schematic conversion run
 *
 * Config file format (key: value pairs, see ConfigParser):
 *   palette_dir: block
 *   blocks: wool, concrete
 *   threads: 4
 *   compress: true
 *   data_version: 3100
 *   metadata: true
 *   author: pixschem
 *   description: Generated by pixschem
 *   keep_aspect: false
 *   verbose: false
 */

#include "pixschem/config_parser.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace pixschem {

struct ConverterConfig {
    std::filesystem::path paletteDir = "block";
    std::vector<std::string> blocks = {"wool", "concrete"};
    size_t threads = 1;          ///< 0 = hardware concurrency
    bool compress = true;
    int32_t dataVersion = 3100;
    bool writeMetadata = true;
    std::string author = "pixschem";
    std::string description = "Generated by pixschem";
    bool keepAspect = false;
    bool verbose = false;

    /// Overlay the recognized keys of `doc` onto this config.
    /// A `blocks` key replaces the default list; repeated keys accumulate.
    void apply(const ConfigDocument& doc);

    /// Defaults overlaid with the given file. Throws ConversionError if it cannot be read.
    [[nodiscard]] static ConverterConfig fromFile(const std::filesystem::path& path);
};

}  // namespace pixschem
