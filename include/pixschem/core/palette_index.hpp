#pragma once

/**
 * @file palette_index.hpp
 * @brief Color to block lookup with nearest-color resolution
 */

#include "pixschem/core/color.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pixschem {

/// Block identifier plus variant (legacy data value, 0 when unused)
struct BlockMapping {
    std::string blockName;  ///< e.g. "minecraft:red_wool"
    int32_t blockData = 0;

    bool operator==(const BlockMapping& other) const = default;
};

/// Block used when nothing can be matched
inline const BlockMapping FALLBACK_BLOCK{"minecraft:white_concrete", 0};

struct PaletteEntry {
    Color color;
    BlockMapping mapping;
};

// Color -> BlockMapping table
//
// Keys are unique; inserting an existing color replaces its mapping but keeps
// the slot of the first insertion. Iteration (and therefore tie-breaking in
// findClosest) follows first-insertion order.
//
// Read-only after construction; concurrent findClosest() calls are safe.
//
class PaletteIndex {
public:
    struct Match {
        BlockMapping mapping;
        bool matched = false;  ///< false: index empty, mapping is FALLBACK_BLOCK
    };

    PaletteIndex() = default;

    // Insert or overwrite one association
    void insert(Color color, BlockMapping mapping);

    // Insert all entries in order, later entries overwrite earlier ones.
    // Throws EmptyPaletteError if the index is still empty afterwards.
    void load(std::span<const PaletteEntry> entries);

    // Nearest registered color by colorDistance(), first-inserted wins ties
    [[nodiscard]] Match findClosest(Color target) const;

    // Exact lookup, nullptr if the color is not registered
    [[nodiscard]] const BlockMapping* find(Color color) const;
    [[nodiscard]] bool contains(Color color) const { return reverse_.contains(color); }

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] const std::vector<PaletteEntry>& entries() const { return entries_; }

private:
    std::vector<PaletteEntry> entries_;
    std::unordered_map<Color, size_t> reverse_;  // Color -> slot in entries_
};

}  // namespace pixschem
