#pragma once

/**
 * @file downsampler.hpp
 * @brief Box-filter reduction of a PixelGrid onto a target cell grid
 *
 * Target cell (x, y) covers the source region
 *   [floor(x*scaleX), floor((x+1)*scaleX)) x [floor(y*scaleY), floor((y+1)*scaleY))
 * with scale = original / target, upper bounds clamped to the source size.
 * The cell color is the per-channel mean of that region, truncated.
 * A region that collapses to zero pixels averages to white.
 */

#include "pixschem/core/color.hpp"
#include "pixschem/core/pixel_grid.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <vector>

namespace pixschem {

struct DownsampledCell {
    glm::ivec2 pos{0};  ///< Target cell coordinate
    Color color;        ///< Average of the source region
};

/// Coerce each axis to at least 1
[[nodiscard]] glm::ivec2 clampTargetSize(glm::ivec2 target);

/// Mean color over [x0, x1) x [y0, y1), white if the region is empty.
/// Bounds are clamped to the grid.
[[nodiscard]] Color averageRegion(const PixelGrid& pixels, int32_t x0, int32_t y0,
                                  int32_t x1, int32_t y1);

/// Average color of one target cell. `target` must already be clamped.
[[nodiscard]] Color averageCell(const PixelGrid& pixels, glm::ivec2 target, int32_t x, int32_t y);

/// One cell per target position, row-major. Zero-sized targets are coerced to 1.
[[nodiscard]] std::vector<DownsampledCell> downsample(const PixelGrid& pixels,
                                                      int32_t targetWidth,
                                                      int32_t targetHeight);

/// Shrink one axis of `requested` so it follows the aspect ratio of
/// `original`. Requests within 0.05 of the original ratio are returned as-is.
[[nodiscard]] glm::ivec2 fitAspectRatio(glm::ivec2 original, glm::ivec2 requested);

}  // namespace pixschem
