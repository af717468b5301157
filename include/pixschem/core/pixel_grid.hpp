#pragma once

/**
 * @file pixel_grid.hpp
 * @brief Decoded RGB image as a row-major grid of Colors
 */

#include "pixschem/core/color.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <span>
#include <vector>

namespace pixschem {

class PixelGrid {
public:
    PixelGrid() = default;

    /// Grid of the given size filled with black. Negative sizes throw std::invalid_argument.
    PixelGrid(int32_t width, int32_t height);

    /// Build from packed RGB bytes (3 per pixel, row-major)
    static PixelGrid fromRGB(int32_t width, int32_t height, std::span<const uint8_t> rgb);

    [[nodiscard]] int32_t width() const { return width_; }
    [[nodiscard]] int32_t height() const { return height_; }
    [[nodiscard]] glm::ivec2 size() const { return {width_, height_}; }
    [[nodiscard]] bool empty() const { return pixels_.empty(); }

    [[nodiscard]] Color& at(int32_t x, int32_t y);
    [[nodiscard]] const Color& at(int32_t x, int32_t y) const;

    /// Unchecked row access for tight loops
    [[nodiscard]] const Color* row(int32_t y) const {
        return pixels_.data() + static_cast<size_t>(y) * static_cast<size_t>(width_);
    }

    [[nodiscard]] const std::vector<Color>& pixels() const { return pixels_; }

private:
    int32_t width_ = 0;
    int32_t height_ = 0;
    std::vector<Color> pixels_;
};

}  // namespace pixschem
