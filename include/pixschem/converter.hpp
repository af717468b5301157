#pragma once

/**
 * @file converter.hpp
 * @brief End-to-end image -> schematic pipeline
 *
 * load palette -> decode image -> downsample + classify -> encode -> write.
 * Every stage either completes or throws; there is no partial output.
 */

#include "pixschem/converter_config.hpp"
#include "pixschem/core/palette_index.hpp"
#include "pixschem/core/pixel_grid.hpp"
#include "pixschem/core/voxel_grid.hpp"
#include "pixschem/io/schematic_io.hpp"

#include <cstdint>
#include <filesystem>
#include <glm/glm.hpp>
#include <optional>

namespace pixschem {

struct ConversionResult {
    std::filesystem::path outputPath;
    glm::ivec2 sourceSize{0};
    glm::ivec2 size{0};          ///< Blocks along X and Z
    int64_t blockCount = 0;
    size_t paletteSize = 0;
    size_t fallbackCells = 0;
    size_t bytesWritten = 0;
};

class Converter {
public:
    explicit Converter(ConverterConfig config);

    /// Run the whole pipeline. `size` omitted means the image's own dimensions.
    ConversionResult convert(const std::filesystem::path& inputImage,
                             const std::filesystem::path& outputPath,
                             std::optional<glm::ivec2> size = std::nullopt);

    /// Pipeline over already-loaded inputs, writing to `outputPath`.
    /// Throws InvalidGridError before any work if the target exceeds
    /// MAX_SCHEMATIC_EXTENT on either axis.
    ConversionResult convert(const PixelGrid& pixels, const PaletteIndex& palette,
                             const std::filesystem::path& outputPath,
                             std::optional<glm::ivec2> size = std::nullopt);

    /// Target size for an image, applying defaults, coercion and keep_aspect
    [[nodiscard]] glm::ivec2 resolveTargetSize(glm::ivec2 imageSize,
                                               std::optional<glm::ivec2> requested) const;

    [[nodiscard]] const ConverterConfig& config() const { return config_; }

private:
    ConverterConfig config_;

    [[nodiscard]] SchematicOptions schematicOptions(const std::filesystem::path& outputPath) const;
};

}  // namespace pixschem
