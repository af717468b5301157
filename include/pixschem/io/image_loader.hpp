#pragma once

/**
 * @file image_loader.hpp
 * @brief Decodes image files (PNG, JPEG, BMP, TGA, PNM, ...) into a PixelGrid
 */

#include "pixschem/core/pixel_grid.hpp"

#include <cstdint>
#include <filesystem>
#include <span>

namespace pixschem {

/// Decode an image file, discarding alpha.
/// Throws ImageDecodeError if the file cannot be decoded or has no pixels.
[[nodiscard]] PixelGrid loadImage(const std::filesystem::path& path);

/// Decode an in-memory encoded image, same rules as loadImage()
[[nodiscard]] PixelGrid decodeImage(std::span<const uint8_t> encoded);

}  // namespace pixschem
