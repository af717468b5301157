#pragma once

/**
 * @file palette_loader.hpp
 * @brief Loads color -> block palettes from JSON source files
 *
 * Each source is `<paletteDir>/<name>.json`: a JSON object keyed by
 * "(R,G,B)" with values {"block_name": ..., "block_data": ...} or
 * [block_name, block_data]. Lines starting with '#' are comments; the first
 * one ("# Display Name") names the source for listings.
 */

#include "pixschem/core/palette_index.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pixschem {

struct PaletteSourceInfo {
    std::string name;         ///< File stem, used to select the source
    std::string displayName;  ///< From the leading "# " comment, else the stem
};

struct PaletteLoadOptions {
    bool verbose = false;
};

/// Parse "(R,G,B)" or "R,G,B"; nullopt if malformed or out of 0..255
[[nodiscard]] std::optional<Color> parseColorKey(std::string_view key);

/// Remove lines whose first non-blank character is '#'
[[nodiscard]] std::string stripCommentLines(std::string_view content);

/// Parse one palette source document. Malformed entries are skipped.
/// Returns nullopt if the content is not a JSON object.
[[nodiscard]] std::optional<std::vector<PaletteEntry>> parsePaletteSource(std::string_view content);

/// Load the named sources, in order, into a fresh index.
/// Throws PaletteSourceMissing if the directory or a source file is absent,
/// BlockMappingParseError if no usable entry was found in any source.
[[nodiscard]] PaletteIndex loadPaletteSources(const std::filesystem::path& paletteDir,
                                              std::span<const std::string> sources,
                                              const PaletteLoadOptions& options = {});

/// All *.json sources in the directory, sorted by name.
/// Throws PaletteSourceMissing if the directory does not exist.
[[nodiscard]] std::vector<PaletteSourceInfo> listPaletteSources(const std::filesystem::path& paletteDir);

}  // namespace pixschem
