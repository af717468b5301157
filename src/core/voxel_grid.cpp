#include "pixschem/core/voxel_grid.hpp"
#include "pixschem/core/downsampler.hpp"
#include "pixschem/core/errors.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace pixschem {

namespace {

// Upper bound on workers per hardware thread
constexpr size_t MAX_THREADS_PER_CORE = 4;

}  // namespace

// ============================================================================
// BlockPalette
// ============================================================================

BlockPalette::Index BlockPalette::addBlock(std::string_view name) {
    auto it = reverse_.find(std::string(name));
    if (it != reverse_.end()) {
        return it->second;
    }

    auto index = static_cast<Index>(names_.size());
    names_.emplace_back(name);
    reverse_.emplace(names_.back(), index);
    return index;
}

BlockPalette::Index BlockPalette::indexOf(std::string_view name) const {
    auto it = reverse_.find(std::string(name));
    if (it != reverse_.end()) {
        return it->second;
    }
    return INVALID_INDEX;
}

const std::string& BlockPalette::name(Index index) const {
    if (index >= names_.size()) {
        throw std::out_of_range("Block palette index " + std::to_string(index) + " out of range");
    }
    return names_[index];
}

// ============================================================================
// VoxelGrid
// ============================================================================

VoxelGrid::VoxelGrid(int32_t width, int32_t height, int32_t depth)
    : width_(width), height_(height), depth_(depth) {
    if (width <= 0 || height <= 0 || depth <= 0) {
        throw std::invalid_argument("VoxelGrid dimensions must be positive");
    }
    indices_.resize(static_cast<size_t>(volume()), 0);
}

VoxelGrid::VoxelGrid(int32_t width, int32_t height, int32_t depth,
                     BlockPalette palette, std::vector<uint32_t> indices)
    : VoxelGrid(width, height, depth) {
    if (indices.size() != indices_.size()) {
        throw std::invalid_argument("VoxelGrid index count " + std::to_string(indices.size()) +
                                    " does not match volume " + std::to_string(volume()));
    }
    for (uint32_t idx : indices) {
        if (idx >= palette.size()) {
            throw std::invalid_argument("VoxelGrid index " + std::to_string(idx) +
                                        " outside palette of size " +
                                        std::to_string(palette.size()));
        }
    }
    indices_ = std::move(indices);
    palette_ = std::move(palette);
}

BlockPalette::Index VoxelGrid::setBlock(int32_t x, int32_t y, int32_t z, std::string_view blockName) {
    if (!contains(x, y, z)) {
        throw std::out_of_range("VoxelGrid::setBlock out of bounds");
    }
    auto index = palette_.addBlock(blockName);
    indices_[flatIndex(x, y, z)] = index;
    return index;
}

uint32_t VoxelGrid::indexAt(int32_t x, int32_t y, int32_t z) const {
    if (!contains(x, y, z)) {
        throw std::out_of_range("VoxelGrid::indexAt out of bounds");
    }
    return indices_[flatIndex(x, y, z)];
}

bool VoxelGrid::hasValidIndices() const {
    return std::all_of(indices_.begin(), indices_.end(),
                       [this](uint32_t idx) { return idx < palette_.size(); });
}

std::vector<uint64_t> VoxelGrid::usageCounts() const {
    std::vector<uint64_t> counts(palette_.size(), 0);
    for (uint32_t idx : indices_) {
        if (idx < counts.size()) {
            ++counts[idx];
        }
    }
    return counts;
}

// ============================================================================
// Grid generation
// ============================================================================

std::vector<PaletteIndex::Match> classifyCells(const PixelGrid& pixels,
                                               const PaletteIndex& index,
                                               glm::ivec2 target,
                                               size_t threads) {
    target = clampTargetSize(target);
    std::vector<PaletteIndex::Match> results(static_cast<size_t>(target.x) *
                                             static_cast<size_t>(target.y));

    auto classifyRows = [&](int32_t rowBegin, int32_t rowEnd) {
        for (int32_t y = rowBegin; y < rowEnd; ++y) {
            for (int32_t x = 0; x < target.x; ++x) {
                Color average = averageCell(pixels, target, x, y);
                results[static_cast<size_t>(y) * static_cast<size_t>(target.x) +
                        static_cast<size_t>(x)] = index.findClosest(average);
            }
        }
    };

    size_t hardware = std::max(1u, std::thread::hardware_concurrency());
    if (threads == 0) {
        threads = hardware;
    }
    threads = std::min({threads, hardware * MAX_THREADS_PER_CORE, static_cast<size_t>(target.y)});

    if (threads <= 1) {
        classifyRows(0, target.y);
        return results;
    }

    // Each worker owns a disjoint band of rows and writes only its own slots
    std::vector<std::exception_ptr> errors(threads);
    std::vector<std::thread> workers;
    workers.reserve(threads);

    auto joinAll = [&workers]() {
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    };

    int32_t rowsPerWorker = target.y / static_cast<int32_t>(threads);
    int32_t extraRows = target.y % static_cast<int32_t>(threads);
    int32_t rowBegin = 0;

    try {
        for (size_t i = 0; i < threads; ++i) {
            int32_t rowEnd = rowBegin + rowsPerWorker + (static_cast<int32_t>(i) < extraRows ? 1 : 0);
            workers.emplace_back([&, i, rowBegin, rowEnd]() {
                try {
                    classifyRows(rowBegin, rowEnd);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
            rowBegin = rowEnd;
        }
    } catch (const std::system_error& e) {
        // Thread creation failed; started workers must finish before unwinding
        joinAll();
        throw ConversionError(std::string("Cannot start classification threads: ") + e.what());
    }

    joinAll();
    for (auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    return results;
}

VoxelBuildResult buildVoxelGrid(const PixelGrid& pixels,
                                const PaletteIndex& index,
                                glm::ivec2 target,
                                size_t threads) {
    target = clampTargetSize(target);
    auto matches = classifyCells(pixels, index, target, threads);

    VoxelBuildResult result{VoxelGrid(target.x, target.y, 1), 0};

    // Sequential pass keeps palette ids in row-major first-seen order
    size_t cell = 0;
    for (int32_t y = 0; y < target.y; ++y) {
        for (int32_t x = 0; x < target.x; ++x) {
            const auto& match = matches[cell++];
            if (!match.matched) {
                ++result.fallbackCells;
            }
            result.grid.setBlock(x, y, 0, match.mapping.blockName);
        }
    }

    return result;
}

}  // namespace pixschem
