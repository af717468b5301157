#pragma once

/**
 * @file voxel_grid.hpp
 * @brief Palette-indexed block volume produced from a downsampled image
 */

#include "pixschem/core/palette_index.hpp"
#include "pixschem/core/pixel_grid.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pixschem {

// ============================================================================
// BlockPalette
// ============================================================================

// Deduplicated block names in first-seen order. Position = schematic palette id.
class BlockPalette {
public:
    using Index = uint32_t;
    static constexpr Index INVALID_INDEX = UINT32_MAX;

    BlockPalette() = default;

    // Returns the existing index, or appends the name
    [[nodiscard]] Index addBlock(std::string_view name);

    // INVALID_INDEX if the name is not in the palette
    [[nodiscard]] Index indexOf(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const {
        return indexOf(name) != INVALID_INDEX;
    }

    // Throws std::out_of_range on a bad index
    [[nodiscard]] const std::string& name(Index index) const;

    [[nodiscard]] size_t size() const { return names_.size(); }
    [[nodiscard]] bool empty() const { return names_.empty(); }
    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, Index> reverse_;
};

// ============================================================================
// VoxelGrid
// ============================================================================

/// Width x height x depth palette indices, stored with x fastest, then y, then z
class VoxelGrid {
public:
    // Every cell starts at index 0 with an empty palette; cells must be set
    // before the grid is valid (see hasValidIndices()).
    VoxelGrid(int32_t width, int32_t height, int32_t depth = 1);

    // Adopt an existing palette and index array. Throws std::invalid_argument
    // if the array size does not match or an index is out of palette range.
    VoxelGrid(int32_t width, int32_t height, int32_t depth,
              BlockPalette palette, std::vector<uint32_t> indices);

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }
    [[nodiscard]] int32_t depth() const { return depth_; }
    [[nodiscard]] glm::ivec3 size() const { return {width_, height_, depth_}; }
    [[nodiscard]] int64_t volume() const {
        return static_cast<int64_t>(width_) * height_ * depth_;
    }

    // ---- Block access ----

    /// Store `blockName` at (x, y, z), adding it to the palette if first seen
    BlockPalette::Index setBlock(int32_t x, int32_t y, int32_t z, std::string_view blockName);

    [[nodiscard]] uint32_t indexAt(int32_t x, int32_t y, int32_t z) const;
    [[nodiscard]] const std::string& blockAt(int32_t x, int32_t y, int32_t z) const {
        return palette_.name(indexAt(x, y, z));
    }

    [[nodiscard]] bool contains(int32_t x, int32_t y, int32_t z) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_ && z >= 0 && z < depth_;
    }

    /// Flat indices in z-major, y, x order
    [[nodiscard]] const std::vector<uint32_t>& indices() const { return indices_; }
    [[nodiscard]] const BlockPalette& palette() const { return palette_; }

    /// True when every cell refers to an existing palette entry
    [[nodiscard]] bool hasValidIndices() const;

    /// Cells referencing each palette entry
    [[nodiscard]] std::vector<uint64_t> usageCounts() const;

private:
    int32_t width_, height_, depth_;
    std::vector<uint32_t> indices_;
    BlockPalette palette_;

    [[nodiscard]] size_t flatIndex(int32_t x, int32_t y, int32_t z) const {
        return static_cast<size_t>(x) +
               static_cast<size_t>(width_) * (static_cast<size_t>(y) +
                                              static_cast<size_t>(height_) * static_cast<size_t>(z));
    }
};

// ============================================================================
// Grid generation
// ============================================================================

struct VoxelBuildResult {
    VoxelGrid grid;
    size_t fallbackCells = 0;  ///< Cells resolved with FALLBACK_BLOCK
};

/// Average and classify every target cell. Result slot i is cell (i % w, i / w).
/// `threads` workers each take a contiguous band of rows; 0 uses hardware
/// concurrency, 1 runs on the calling thread. Worker count is capped at a
/// small multiple of hardware concurrency and at the row count. Throws
/// ConversionError if the workers cannot be started.
[[nodiscard]] std::vector<PaletteIndex::Match> classifyCells(const PixelGrid& pixels,
                                                             const PaletteIndex& index,
                                                             glm::ivec2 target,
                                                             size_t threads = 1);

/// Downsample `pixels` to `target` (coerced to >= 1 per axis) and build the
/// single-layer voxel grid. Palette ids are assigned in row-major cell order.
[[nodiscard]] VoxelBuildResult buildVoxelGrid(const PixelGrid& pixels,
                                              const PaletteIndex& index,
                                              glm::ivec2 target,
                                              size_t threads = 1);

}  // namespace pixschem
