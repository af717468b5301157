#include "pixschem/core/palette_index.hpp"
#include "pixschem/core/errors.hpp"

#include <limits>

namespace pixschem {

void PaletteIndex::insert(Color color, BlockMapping mapping) {
    auto it = reverse_.find(color);
    if (it != reverse_.end()) {
        entries_[it->second].mapping = std::move(mapping);
        return;
    }

    reverse_[color] = entries_.size();
    entries_.push_back(PaletteEntry{color, std::move(mapping)});
}

void PaletteIndex::load(std::span<const PaletteEntry> entries) {
    for (const auto& entry : entries) {
        insert(entry.color, entry.mapping);
    }

    if (entries_.empty()) {
        throw EmptyPaletteError("Palette is empty: no color mappings were loaded");
    }
}

PaletteIndex::Match PaletteIndex::findClosest(Color target) const {
    const PaletteEntry* closest = nullptr;
    double minDistance = std::numeric_limits<double>::max();

    for (const auto& entry : entries_) {
        double distance = colorDistance(target, entry.color);
        if (distance < minDistance) {
            minDistance = distance;
            closest = &entry;
        }
    }

    if (closest) {
        return Match{closest->mapping, true};
    }
    return Match{FALLBACK_BLOCK, false};
}

const BlockMapping* PaletteIndex::find(Color color) const {
    auto it = reverse_.find(color);
    if (it == reverse_.end()) {
        return nullptr;
    }
    return &entries_[it->second].mapping;
}

}  // namespace pixschem
