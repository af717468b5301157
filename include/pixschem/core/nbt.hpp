#pragma once

/**
 * @file nbt.hpp
 * @brief Big-endian NBT (Named Binary Tag) encoding and decoding
 *
 * Only the tag types the schematic writer needs are covered. Every integer
 * is written at its declared tag width.
 */

#include "pixschem/core/errors.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pixschem {
namespace nbt {

// Tag type ids
constexpr uint8_t TAG_END = 0;
constexpr uint8_t TAG_BYTE = 1;
constexpr uint8_t TAG_SHORT = 2;
constexpr uint8_t TAG_INT = 3;
constexpr uint8_t TAG_LONG = 4;
constexpr uint8_t TAG_FLOAT = 5;
constexpr uint8_t TAG_DOUBLE = 6;
constexpr uint8_t TAG_BYTE_ARRAY = 7;
constexpr uint8_t TAG_STRING = 8;
constexpr uint8_t TAG_LIST = 9;
constexpr uint8_t TAG_COMPOUND = 10;
constexpr uint8_t TAG_INT_ARRAY = 11;
constexpr uint8_t TAG_LONG_ARRAY = 12;

// ============================================================================
// Encoding
// ============================================================================

inline void writeU8(std::vector<uint8_t>& out, uint8_t value) {
    out.push_back(value);
}

inline void writeI16(std::vector<uint8_t>& out, int16_t value) {
    auto bits = static_cast<uint16_t>(value);
    out.push_back(static_cast<uint8_t>(bits >> 8));
    out.push_back(static_cast<uint8_t>(bits));
}

inline void writeI32(std::vector<uint8_t>& out, int32_t value) {
    auto bits = static_cast<uint32_t>(value);
    out.push_back(static_cast<uint8_t>(bits >> 24));
    out.push_back(static_cast<uint8_t>(bits >> 16));
    out.push_back(static_cast<uint8_t>(bits >> 8));
    out.push_back(static_cast<uint8_t>(bits));
}

inline void writeI64(std::vector<uint8_t>& out, int64_t value) {
    auto bits = static_cast<uint64_t>(value);
    for (int i = 7; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>(bits >> (i * 8)));
    }
}

// String payload: unsigned 16-bit length + UTF-8 bytes
inline void writeStringPayload(std::vector<uint8_t>& out, std::string_view str) {
    if (str.size() > 0xFFFF) {
        throw std::length_error("NBT string longer than 65535 bytes");
    }
    auto length = static_cast<uint16_t>(str.size());
    out.push_back(static_cast<uint8_t>(length >> 8));
    out.push_back(static_cast<uint8_t>(length));
    out.insert(out.end(), str.begin(), str.end());
}

// Tag type byte followed by the tag name
inline void writeTagHeader(std::vector<uint8_t>& out, uint8_t tagType, std::string_view name) {
    out.push_back(tagType);
    writeStringPayload(out, name);
}

inline void writeShort(std::vector<uint8_t>& out, std::string_view name, int16_t value) {
    writeTagHeader(out, TAG_SHORT, name);
    writeI16(out, value);
}

inline void writeInt(std::vector<uint8_t>& out, std::string_view name, int32_t value) {
    writeTagHeader(out, TAG_INT, name);
    writeI32(out, value);
}

inline void writeLong(std::vector<uint8_t>& out, std::string_view name, int64_t value) {
    writeTagHeader(out, TAG_LONG, name);
    writeI64(out, value);
}

inline void writeString(std::vector<uint8_t>& out, std::string_view name, std::string_view value) {
    writeTagHeader(out, TAG_STRING, name);
    writeStringPayload(out, value);
}

inline void writeByteArray(std::vector<uint8_t>& out, std::string_view name,
                           std::span<const uint8_t> bytes) {
    writeTagHeader(out, TAG_BYTE_ARRAY, name);
    writeI32(out, static_cast<int32_t>(bytes.size()));
    out.insert(out.end(), bytes.begin(), bytes.end());
}

inline void writeIntArray(std::vector<uint8_t>& out, std::string_view name,
                          std::span<const int32_t> values) {
    writeTagHeader(out, TAG_INT_ARRAY, name);
    writeI32(out, static_cast<int32_t>(values.size()));
    for (int32_t v : values) {
        writeI32(out, v);
    }
}

// Start a list; the caller writes `count` bare payloads of `elementType`
inline void writeListHeader(std::vector<uint8_t>& out, std::string_view name,
                            uint8_t elementType, int32_t count) {
    writeTagHeader(out, TAG_LIST, name);
    out.push_back(elementType);
    writeI32(out, count);
}

// Start a compound; close it with writeEnd()
inline void writeCompoundHeader(std::vector<uint8_t>& out, std::string_view name) {
    writeTagHeader(out, TAG_COMPOUND, name);
}

inline void writeEnd(std::vector<uint8_t>& out) {
    out.push_back(TAG_END);
}

// ============================================================================
// Decoding
// ============================================================================

class Decoder {
public:
    Decoder(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}
    Decoder(std::span<const uint8_t> span) : data_(span.data()), size_(span.size()), pos_(0) {}

    [[nodiscard]] bool hasMore() const { return pos_ < size_; }
    [[nodiscard]] size_t position() const { return pos_; }
    [[nodiscard]] size_t remaining() const { return size_ - pos_; }

    uint8_t readU8() {
        require(1);
        return data_[pos_++];
    }

    int16_t readI16() {
        require(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return static_cast<int16_t>(v);
    }

    int32_t readI32() {
        require(4);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     data_[pos_ + 3];
        pos_ += 4;
        return static_cast<int32_t>(v);
    }

    int64_t readI64() {
        require(8);
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v = (v << 8) | data_[pos_++];
        }
        return static_cast<int64_t>(v);
    }

    std::string readStringPayload() {
        require(2);
        size_t length = (static_cast<size_t>(data_[pos_]) << 8) | data_[pos_ + 1];
        pos_ += 2;
        require(length);
        std::string result(reinterpret_cast<const char*>(data_ + pos_), length);
        pos_ += length;
        return result;
    }

    std::vector<uint8_t> readByteArrayPayload() {
        auto length = arrayLength();
        require(length);
        std::vector<uint8_t> result(data_ + pos_, data_ + pos_ + length);
        pos_ += length;
        return result;
    }

    std::vector<int32_t> readIntArrayPayload() {
        auto length = arrayLength();
        require(length * 4);
        std::vector<int32_t> result;
        result.reserve(length);
        for (size_t i = 0; i < length; ++i) {
            result.push_back(readI32());
        }
        return result;
    }

    // Skip the payload of a tag whose header has already been read
    void skipPayload(uint8_t tagType) {
        switch (tagType) {
            case TAG_END:
                break;
            case TAG_BYTE:
                skip(1);
                break;
            case TAG_SHORT:
                skip(2);
                break;
            case TAG_INT:
            case TAG_FLOAT:
                skip(4);
                break;
            case TAG_LONG:
            case TAG_DOUBLE:
                skip(8);
                break;
            case TAG_BYTE_ARRAY:
                skip(arrayLength());
                break;
            case TAG_STRING: {
                require(2);
                size_t length = (static_cast<size_t>(data_[pos_]) << 8) | data_[pos_ + 1];
                skip(2 + length);
                break;
            }
            case TAG_LIST: {
                uint8_t elementType = readU8();
                auto count = arrayLength();
                for (size_t i = 0; i < count; ++i) {
                    skipPayload(elementType);
                }
                break;
            }
            case TAG_COMPOUND:
                while (true) {
                    uint8_t childType = readU8();
                    if (childType == TAG_END) break;
                    skip(nameLength());
                    skipPayload(childType);
                }
                break;
            case TAG_INT_ARRAY:
                skip(arrayLength() * 4);
                break;
            case TAG_LONG_ARRAY:
                skip(arrayLength() * 8);
                break;
            default:
                throw SchematicFormatError("Unknown NBT tag type " + std::to_string(tagType));
        }
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;

    void require(size_t count) const {
        if (count > size_ - pos_) {
            throw SchematicFormatError("Truncated NBT data at offset " + std::to_string(pos_));
        }
    }

    void skip(size_t count) {
        require(count);
        pos_ += count;
    }

    size_t arrayLength() {
        int32_t length = readI32();
        if (length < 0) {
            throw SchematicFormatError("Negative NBT array length");
        }
        return static_cast<size_t>(length);
    }

    // Reads the 16-bit name length prefix, leaves the name bytes unread
    size_t nameLength() {
        require(2);
        size_t length = (static_cast<size_t>(data_[pos_]) << 8) | data_[pos_ + 1];
        pos_ += 2;
        return length;
    }
};

}  // namespace nbt
}  // namespace pixschem
