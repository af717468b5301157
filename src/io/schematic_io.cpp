/**
 * @file schematic_io.cpp
 * @brief Sponge schematic NBT serialization and gzip file I/O
 */

#include "pixschem/io/schematic_io.hpp"
#include "pixschem/core/errors.hpp"
#include "pixschem/core/nbt.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_map>

namespace pixschem {

namespace {

constexpr const char* ROOT_NAME = "Schematic";

// windowBits for zlib: 15 + 16 selects a gzip wrapper, 15 + 32 auto-detects
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int AUTO_WINDOW_BITS = 15 + 32;

int16_t checkedExtent(int32_t value, const char* field) {
    if (value > MAX_SCHEMATIC_EXTENT) {
        throw InvalidGridError(std::string("Schematic ") + field + " " +
                               std::to_string(value) + " exceeds " +
                               std::to_string(MAX_SCHEMATIC_EXTENT));
    }
    return static_cast<int16_t>(value);
}

}  // namespace

// ============================================================================
// BlockData varints
// ============================================================================

void encodeVarInt(std::vector<uint8_t>& out, uint32_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<uint8_t>(value));
}

std::vector<uint32_t> decodeVarInts(std::span<const uint8_t> data) {
    std::vector<uint32_t> values;
    values.reserve(data.size());

    uint32_t value = 0;
    int shift = 0;
    for (uint8_t byte : data) {
        if (shift > 28) {
            throw SchematicFormatError("BlockData varint too long");
        }
        value |= static_cast<uint32_t>(byte & 0x7F) << shift;
        if (byte & 0x80) {
            shift += 7;
        } else {
            values.push_back(value);
            value = 0;
            shift = 0;
        }
    }
    if (shift != 0) {
        throw SchematicFormatError("BlockData ends inside a varint");
    }
    return values;
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> encodeSchematic(const VoxelGrid& grid, const SchematicOptions& options) {
    std::vector<uint8_t> out;
    out.reserve(256 + static_cast<size_t>(grid.volume()));

    const auto& palette = grid.palette();
    if (!grid.hasValidIndices()) {
        throw InvalidGridError("Voxel grid has cells outside its palette of " +
                               std::to_string(palette.size()) + " blocks");
    }

    nbt::writeCompoundHeader(out, ROOT_NAME);

    nbt::writeInt(out, "Version", SCHEMATIC_VERSION);
    nbt::writeInt(out, "DataVersion", options.dataVersion);

    // Image rows run along Z (Length); the single layer is Y (Height)
    nbt::writeShort(out, "Width", checkedExtent(grid.width(), "Width"));
    nbt::writeShort(out, "Height", checkedExtent(grid.depth(), "Height"));
    nbt::writeShort(out, "Length", checkedExtent(grid.height(), "Length"));

    const std::array<int32_t, 3> offset{0, 0, 0};
    nbt::writeIntArray(out, "Offset", offset);

    nbt::writeInt(out, "PaletteMax", static_cast<int32_t>(palette.size()));

    nbt::writeCompoundHeader(out, "Palette");
    for (size_t id = 0; id < palette.size(); ++id) {
        nbt::writeInt(out, palette.names()[id], static_cast<int32_t>(id));
    }
    nbt::writeEnd(out);

    // indices() is already z outer, y middle, x inner
    std::vector<uint8_t> blockData;
    blockData.reserve(static_cast<size_t>(grid.volume()));
    for (uint32_t idx : grid.indices()) {
        encodeVarInt(blockData, idx);
    }
    nbt::writeByteArray(out, "BlockData", blockData);

    nbt::writeListHeader(out, "BlockEntities", nbt::TAG_END, 0);

    if (options.metadata) {
        const auto& meta = *options.metadata;
        nbt::writeCompoundHeader(out, "Metadata");
        nbt::writeString(out, "Name", meta.name);
        nbt::writeString(out, "Author", meta.author);
        nbt::writeLong(out, "Date", meta.dateMillis);
        nbt::writeString(out, "Description", meta.description);
        nbt::writeEnd(out);
    }

    nbt::writeEnd(out);
    return out;
}

// ============================================================================
// Deserialization
// ============================================================================

namespace {

void expectTag(uint8_t actual, uint8_t expected, const std::string& name) {
    if (actual != expected) {
        throw SchematicFormatError("Field '" + name + "' has tag type " + std::to_string(actual) +
                                   ", expected " + std::to_string(expected));
    }
}

SchematicMetadata readMetadata(nbt::Decoder& decoder) {
    SchematicMetadata meta;
    while (true) {
        uint8_t tagType = decoder.readU8();
        if (tagType == nbt::TAG_END) break;
        std::string name = decoder.readStringPayload();

        if (name == "Name" && tagType == nbt::TAG_STRING) {
            meta.name = decoder.readStringPayload();
        } else if (name == "Author" && tagType == nbt::TAG_STRING) {
            meta.author = decoder.readStringPayload();
        } else if (name == "Description" && tagType == nbt::TAG_STRING) {
            meta.description = decoder.readStringPayload();
        } else if (name == "Date" && tagType == nbt::TAG_LONG) {
            meta.dateMillis = decoder.readI64();
        } else {
            decoder.skipPayload(tagType);
        }
    }
    return meta;
}

}  // namespace

DecodedSchematic decodeSchematic(std::span<const uint8_t> data) {
    std::vector<uint8_t> inflated;
    if (isGzip(data)) {
        inflated = gzipDecompress(data);
        data = inflated;
    }

    nbt::Decoder decoder(data);

    if (decoder.readU8() != nbt::TAG_COMPOUND) {
        throw SchematicFormatError("Schematic root is not a compound tag");
    }
    (void)decoder.readStringPayload();  // root name, not checked

    int32_t version = 0;
    int32_t dataVersion = 0;
    int32_t width = -1, height = -1, length = -1;
    std::unordered_map<std::string, int32_t> paletteIds;
    std::vector<uint8_t> blockData;
    bool haveBlockData = false;
    std::optional<SchematicMetadata> metadata;

    while (true) {
        uint8_t tagType = decoder.readU8();
        if (tagType == nbt::TAG_END) break;
        std::string name = decoder.readStringPayload();

        if (name == "Version") {
            expectTag(tagType, nbt::TAG_INT, name);
            version = decoder.readI32();
        } else if (name == "DataVersion") {
            expectTag(tagType, nbt::TAG_INT, name);
            dataVersion = decoder.readI32();
        } else if (name == "Width") {
            expectTag(tagType, nbt::TAG_SHORT, name);
            width = static_cast<uint16_t>(decoder.readI16());
        } else if (name == "Height") {
            expectTag(tagType, nbt::TAG_SHORT, name);
            height = static_cast<uint16_t>(decoder.readI16());
        } else if (name == "Length") {
            expectTag(tagType, nbt::TAG_SHORT, name);
            length = static_cast<uint16_t>(decoder.readI16());
        } else if (name == "Palette") {
            expectTag(tagType, nbt::TAG_COMPOUND, name);
            while (true) {
                uint8_t entryType = decoder.readU8();
                if (entryType == nbt::TAG_END) break;
                std::string blockName = decoder.readStringPayload();
                expectTag(entryType, nbt::TAG_INT, "Palette." + blockName);
                paletteIds[blockName] = decoder.readI32();
            }
        } else if (name == "BlockData") {
            expectTag(tagType, nbt::TAG_BYTE_ARRAY, name);
            blockData = decoder.readByteArrayPayload();
            haveBlockData = true;
        } else if (name == "Metadata" && tagType == nbt::TAG_COMPOUND) {
            metadata = readMetadata(decoder);
        } else {
            decoder.skipPayload(tagType);
        }
    }

    if (width <= 0 || height <= 0 || length <= 0) {
        throw SchematicFormatError("Invalid schematic: bad dimensions");
    }
    if (!haveBlockData) {
        throw SchematicFormatError("Invalid schematic: missing BlockData");
    }

    // Palette ids must be exactly 0..n-1
    std::vector<std::string> namesById(paletteIds.size());
    std::vector<bool> seen(paletteIds.size(), false);
    for (const auto& [blockName, id] : paletteIds) {
        if (id < 0 || static_cast<size_t>(id) >= namesById.size() || seen[id]) {
            throw SchematicFormatError("Invalid schematic: palette ids are not contiguous");
        }
        namesById[id] = blockName;
        seen[id] = true;
    }

    BlockPalette palette;
    for (const auto& blockName : namesById) {
        (void)palette.addBlock(blockName);
    }

    auto indices = decodeVarInts(blockData);

    // Our grid is (x, image row, layer) = (Width, Length, Height)
    try {
        return DecodedSchematic{version, dataVersion,
                                VoxelGrid(width, length, height, std::move(palette), std::move(indices)),
                                std::move(metadata)};
    } catch (const std::invalid_argument& e) {
        throw SchematicFormatError(std::string("Invalid schematic: ") + e.what());
    }
}

// ============================================================================
// Compression
// ============================================================================

bool isGzip(std::span<const uint8_t> data) {
    return data.size() >= 2 && data[0] == 0x1F && data[1] == 0x8B;
}

std::vector<uint8_t> gzipCompress(std::span<const uint8_t> data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw WriteError("gzip compression init failed");
    }

    std::vector<uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())));
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    int rc = deflate(&stream, Z_FINISH);
    size_t produced = stream.total_out;
    deflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        throw WriteError("gzip compression failed");
    }
    out.resize(produced);
    return out;
}

std::vector<uint8_t> gzipDecompress(std::span<const uint8_t> data) {
    z_stream stream{};
    if (inflateInit2(&stream, AUTO_WINDOW_BITS) != Z_OK) {
        throw SchematicFormatError("gzip decompression init failed");
    }

    std::vector<uint8_t> out;
    std::array<uint8_t, 16384> chunk{};
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&stream);
            throw SchematicFormatError("gzip decompression failed");
        }
        auto produced = static_cast<std::ptrdiff_t>(chunk.size() - stream.avail_out);
        out.insert(out.end(), chunk.begin(), chunk.begin() + produced);
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw SchematicFormatError("Truncated gzip stream");
        }
    }

    inflateEnd(&stream);
    return out;
}

// ============================================================================
// File I/O
// ============================================================================

std::filesystem::path withSchematicExtension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == SCHEMATIC_EXTENSION) {
        return path;
    }

    std::filesystem::path result = path;
    result += SCHEMATIC_EXTENSION;
    return result;
}

SavedSchematic saveSchematic(const VoxelGrid& grid, const std::filesystem::path& path,
                             const SchematicOptions& options) {
    auto bytes = encodeSchematic(grid, options);
    if (options.compress) {
        bytes = gzipCompress(bytes);
    }

    auto outputPath = withSchematicExtension(path);

    std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw WriteError("Failed to open file for writing: " + outputPath.string());
    }

    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        throw WriteError("Failed to write schematic: " + outputPath.string());
    }

    return SavedSchematic{outputPath, bytes.size()};
}

DecodedSchematic loadSchematic(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw SchematicFormatError("Failed to open schematic file: " + path.string());
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return decodeSchematic(bytes);
}

}  // namespace pixschem
