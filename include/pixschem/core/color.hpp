#pragma once

/**
 * @file color.hpp
 * @brief 8-bit RGB color value type and perceptual distance
 */

#include <cstdint>
#include <functional>
#include <string>

namespace pixschem {

// ============================================================================
// Color
// ============================================================================

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    constexpr Color() = default;
    constexpr Color(uint8_t red, uint8_t green, uint8_t blue) : r(red), g(green), b(blue) {}

    constexpr bool operator==(const Color& other) const = default;

    /// Pack into 0x00RRGGBB
    [[nodiscard]] constexpr uint32_t pack() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    [[nodiscard]] static constexpr Color unpack(uint32_t packed) {
        return Color(static_cast<uint8_t>(packed >> 16),
                     static_cast<uint8_t>(packed >> 8),
                     static_cast<uint8_t>(packed));
    }

    /// "(R,G,B)" form used as palette source keys
    [[nodiscard]] std::string toString() const;
};

inline constexpr Color WHITE{255, 255, 255};

// ============================================================================
// Color metric
// ============================================================================

/// Redmean-weighted Euclidean distance in RGB space.
/// Symmetric, non-negative, zero iff a == b.
[[nodiscard]] double colorDistance(Color a, Color b);

}  // namespace pixschem

template<>
struct std::hash<pixschem::Color> {
    size_t operator()(const pixschem::Color& c) const noexcept {
        return std::hash<uint32_t>{}(c.pack());
    }
};
