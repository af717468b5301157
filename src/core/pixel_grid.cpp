#include "pixschem/core/pixel_grid.hpp"

#include <stdexcept>
#include <string>

namespace pixschem {

PixelGrid::PixelGrid(int32_t width, int32_t height)
    : width_(width), height_(height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("PixelGrid dimensions must be non-negative");
    }
    pixels_.resize(static_cast<size_t>(width) * static_cast<size_t>(height));
}

PixelGrid PixelGrid::fromRGB(int32_t width, int32_t height, std::span<const uint8_t> rgb) {
    PixelGrid grid(width, height);
    if (rgb.size() < grid.pixels_.size() * 3) {
        throw std::invalid_argument("RGB buffer too small for " + std::to_string(width) +
                                    "x" + std::to_string(height) + " image");
    }

    for (size_t i = 0; i < grid.pixels_.size(); ++i) {
        grid.pixels_[i] = Color(rgb[i * 3], rgb[i * 3 + 1], rgb[i * 3 + 2]);
    }
    return grid;
}

Color& PixelGrid::at(int32_t x, int32_t y) {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        throw std::out_of_range("PixelGrid::at out of bounds");
    }
    return pixels_[static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)];
}

const Color& PixelGrid::at(int32_t x, int32_t y) const {
    if (x < 0 || x >= width_ || y < 0 || y >= height_) {
        throw std::out_of_range("PixelGrid::at out of bounds");
    }
    return pixels_[static_cast<size_t>(y) * static_cast<size_t>(width_) + static_cast<size_t>(x)];
}

}  // namespace pixschem
