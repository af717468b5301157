#include "pixschem/core/downsampler.hpp"

#include <algorithm>
#include <cmath>

namespace pixschem {

namespace {

constexpr double ASPECT_TOLERANCE = 0.05;

// floor(index * scale) for non-negative operands, clamped to [0, limit]
int32_t scaledBound(int32_t index, double scale, int32_t limit) {
    auto bound = static_cast<int64_t>(static_cast<double>(index) * scale);
    return static_cast<int32_t>(std::clamp<int64_t>(bound, 0, limit));
}

}  // namespace

glm::ivec2 clampTargetSize(glm::ivec2 target) {
    return {std::max(1, target.x), std::max(1, target.y)};
}

Color averageRegion(const PixelGrid& pixels, int32_t x0, int32_t y0, int32_t x1, int32_t y1) {
    x0 = std::clamp(x0, 0, pixels.width());
    x1 = std::clamp(x1, 0, pixels.width());
    y0 = std::clamp(y0, 0, pixels.height());
    y1 = std::clamp(y1, 0, pixels.height());

    if (x1 <= x0 || y1 <= y0) {
        return WHITE;
    }

    uint64_t sumR = 0, sumG = 0, sumB = 0;
    for (int32_t y = y0; y < y1; ++y) {
        const Color* row = pixels.row(y);
        for (int32_t x = x0; x < x1; ++x) {
            sumR += row[x].r;
            sumG += row[x].g;
            sumB += row[x].b;
        }
    }

    // Integer division truncates, same as truncating the real-valued mean
    uint64_t count = static_cast<uint64_t>(x1 - x0) * static_cast<uint64_t>(y1 - y0);
    return Color(static_cast<uint8_t>(sumR / count),
                 static_cast<uint8_t>(sumG / count),
                 static_cast<uint8_t>(sumB / count));
}

Color averageCell(const PixelGrid& pixels, glm::ivec2 target, int32_t x, int32_t y) {
    double scaleX = static_cast<double>(pixels.width()) / static_cast<double>(target.x);
    double scaleY = static_cast<double>(pixels.height()) / static_cast<double>(target.y);

    int32_t srcX = scaledBound(x, scaleX, pixels.width());
    int32_t srcY = scaledBound(y, scaleY, pixels.height());
    int32_t endX = scaledBound(x + 1, scaleX, pixels.width());
    int32_t endY = scaledBound(y + 1, scaleY, pixels.height());

    return averageRegion(pixels, srcX, srcY, endX, endY);
}

std::vector<DownsampledCell> downsample(const PixelGrid& pixels, int32_t targetWidth,
                                        int32_t targetHeight) {
    glm::ivec2 target = clampTargetSize({targetWidth, targetHeight});

    std::vector<DownsampledCell> cells;
    cells.reserve(static_cast<size_t>(target.x) * static_cast<size_t>(target.y));

    for (int32_t y = 0; y < target.y; ++y) {
        for (int32_t x = 0; x < target.x; ++x) {
            cells.push_back(DownsampledCell{{x, y}, averageCell(pixels, target, x, y)});
        }
    }
    return cells;
}

glm::ivec2 fitAspectRatio(glm::ivec2 original, glm::ivec2 requested) {
    requested = clampTargetSize(requested);
    if (original.x <= 0 || original.y <= 0) {
        return requested;
    }

    double originalRatio = static_cast<double>(original.x) / original.y;
    double targetRatio = static_cast<double>(requested.x) / requested.y;

    if (std::abs(originalRatio - targetRatio) < ASPECT_TOLERANCE) {
        return requested;
    }

    glm::ivec2 best = requested;
    if (originalRatio > targetRatio) {
        // Width is the limiting axis
        best.y = static_cast<int32_t>(requested.x / originalRatio);
    } else {
        best.x = static_cast<int32_t>(requested.y * originalRatio);
    }
    return clampTargetSize(best);
}

}  // namespace pixschem
