#include "pixschem/core/color.hpp"

#include <cmath>

namespace pixschem {

std::string Color::toString() const {
    return "(" + std::to_string(r) + "," + std::to_string(g) + "," + std::to_string(b) + ")";
}

double colorDistance(Color a, Color b) {
    const double r1 = a.r, g1 = a.g, b1 = a.b;
    const double r2 = b.r, g2 = b.g, b2 = b.b;
    const double rMean = (r1 + r2) / 2.0;

    const double rDiff = r1 - r2;
    const double gDiff = g1 - g2;
    const double bDiff = b1 - b2;

    return std::sqrt((2.0 + rMean / 256.0) * (rDiff * rDiff) +
                     4.0 * (gDiff * gDiff) +
                     (2.0 + (255.0 - rMean) / 256.0) * (bDiff * bDiff));
}

}  // namespace pixschem
