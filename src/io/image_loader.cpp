#include "pixschem/io/image_loader.hpp"
#include "pixschem/core/errors.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>

#include <climits>
#include <memory>
#include <string>

namespace pixschem {

namespace {

constexpr int RGB_CHANNELS = 3;

struct StbiDeleter {
    void operator()(stbi_uc* data) const { stbi_image_free(data); }
};
using StbiPixels = std::unique_ptr<stbi_uc, StbiDeleter>;

PixelGrid toPixelGrid(StbiPixels pixels, int width, int height, const std::string& what) {
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw ImageDecodeError("Cannot decode image " + what + ": " +
                               (reason ? reason : "unknown error"));
    }
    if (width <= 0 || height <= 0) {
        throw ImageDecodeError("Image " + what + " has no pixels");
    }

    size_t byteCount = static_cast<size_t>(width) * static_cast<size_t>(height) * RGB_CHANNELS;
    return PixelGrid::fromRGB(width, height, std::span<const uint8_t>(pixels.get(), byteCount));
}

}  // namespace

PixelGrid loadImage(const std::filesystem::path& path) {
    if (!std::filesystem::is_regular_file(path)) {
        throw ImageDecodeError("Image file not found: " + path.string());
    }

    int width = 0, height = 0, channels = 0;
    StbiPixels pixels(stbi_load(path.string().c_str(), &width, &height, &channels, RGB_CHANNELS));
    return toPixelGrid(std::move(pixels), width, height, path.string());
}

PixelGrid decodeImage(std::span<const uint8_t> encoded) {
    if (encoded.empty() || encoded.size() > static_cast<size_t>(INT_MAX)) {
        throw ImageDecodeError("Cannot decode image <memory>: invalid buffer size");
    }

    int width = 0, height = 0, channels = 0;
    StbiPixels pixels(stbi_load_from_memory(encoded.data(), static_cast<int>(encoded.size()),
                                            &width, &height, &channels, RGB_CHANNELS));
    return toPixelGrid(std::move(pixels), width, height, "<memory>");
}

}  // namespace pixschem
