/**
 * @file schematic_io.hpp
 * @brief Sponge schematic (.schem, version 2) serialization and file I/O
 *
 * Root compound "Schematic": Version, DataVersion, Width (X), Height (Y,
 * the one-voxel depth), Length (Z, image rows), Offset, PaletteMax, Palette,
 * BlockData, BlockEntities, and an optional Metadata compound.
 * Files are gzip-compressed NBT unless compression is disabled.
 */

#pragma once

#include "pixschem/core/voxel_grid.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pixschem {

constexpr int32_t SCHEMATIC_VERSION = 2;
constexpr int32_t DEFAULT_DATA_VERSION = 3100;
constexpr int32_t MAX_SCHEMATIC_EXTENT = 32767;  ///< Dimensions are TAG_Short
inline constexpr const char* SCHEMATIC_EXTENSION = ".schem";

struct SchematicMetadata {
    std::string name;
    std::string author;
    std::string description;
    int64_t dateMillis = 0;  ///< ms since Unix epoch

    bool operator==(const SchematicMetadata& other) const = default;
};

struct SchematicOptions {
    int32_t dataVersion = DEFAULT_DATA_VERSION;
    bool compress = true;                        ///< gzip the file (saveSchematic only)
    std::optional<SchematicMetadata> metadata;   ///< Written as "Metadata" when set
};

/// Result of reading a schematic back
struct DecodedSchematic {
    int32_t version = 0;
    int32_t dataVersion = 0;
    VoxelGrid grid;
    std::optional<SchematicMetadata> metadata;
};

struct SavedSchematic {
    std::filesystem::path path;  ///< Final path, with extension appended if needed
    size_t bytesWritten = 0;
};

/// Serialize to uncompressed NBT bytes. Throws InvalidGridError if an extent
/// exceeds MAX_SCHEMATIC_EXTENT or a cell has no palette entry.
[[nodiscard]] std::vector<uint8_t> encodeSchematic(const VoxelGrid& grid,
                                                   const SchematicOptions& options = {});

/// Parse uncompressed or gzip-compressed schematic bytes.
/// Throws SchematicFormatError on malformed input.
[[nodiscard]] DecodedSchematic decodeSchematic(std::span<const uint8_t> data);

/// Append ".schem" unless the path already ends with it (any case)
[[nodiscard]] std::filesystem::path withSchematicExtension(const std::filesystem::path& path);

/// Encode, optionally compress, and write. Throws WriteError on I/O failure.
SavedSchematic saveSchematic(const VoxelGrid& grid, const std::filesystem::path& path,
                             const SchematicOptions& options = {});

/// Read and decode a schematic file
[[nodiscard]] DecodedSchematic loadSchematic(const std::filesystem::path& path);

// Sponge BlockData varint helpers (unsigned LEB128)
void encodeVarInt(std::vector<uint8_t>& out, uint32_t value);
[[nodiscard]] std::vector<uint32_t> decodeVarInts(std::span<const uint8_t> data);

// gzip helpers
[[nodiscard]] std::vector<uint8_t> gzipCompress(std::span<const uint8_t> data);
[[nodiscard]] std::vector<uint8_t> gzipDecompress(std::span<const uint8_t> data);
[[nodiscard]] bool isGzip(std::span<const uint8_t> data);

}  // namespace pixschem
