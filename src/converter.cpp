#include "pixschem/converter.hpp"
#include "pixschem/core/downsampler.hpp"
#include "pixschem/core/errors.hpp"
#include "pixschem/io/image_loader.hpp"
#include "pixschem/io/palette_loader.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace pixschem {

Converter::Converter(ConverterConfig config)
    : config_(std::move(config)) {}

ConversionResult Converter::convert(const std::filesystem::path& inputImage,
                                    const std::filesystem::path& outputPath,
                                    std::optional<glm::ivec2> size) {
    auto palette = loadPaletteSources(config_.paletteDir, config_.blocks,
                                      PaletteLoadOptions{config_.verbose});

    auto pixels = loadImage(inputImage);
    if (config_.verbose) {
        std::cout << "[Converter] Loaded " << inputImage.string() << " ("
                  << pixels.width() << "x" << pixels.height() << ")\n";
    }

    return convert(pixels, palette, outputPath, size);
}

ConversionResult Converter::convert(const PixelGrid& pixels, const PaletteIndex& palette,
                                    const std::filesystem::path& outputPath,
                                    std::optional<glm::ivec2> size) {
    if (pixels.empty()) {
        throw ImageDecodeError("Image has no pixels");
    }

    glm::ivec2 target = resolveTargetSize(pixels.size(), size);
    if (target.x > MAX_SCHEMATIC_EXTENT || target.y > MAX_SCHEMATIC_EXTENT) {
        throw InvalidGridError("Target size " + std::to_string(target.x) + "x" +
                               std::to_string(target.y) + " exceeds the schematic limit of " +
                               std::to_string(MAX_SCHEMATIC_EXTENT) + " blocks per axis");
    }
    if (size && config_.keepAspect && target != clampTargetSize(*size)) {
        std::cout << "[Converter] Using " << target.x << "x" << target.y
                  << " to keep the image aspect ratio " << pixels.width() << ":" << pixels.height() << "\n";
    }

    auto built = buildVoxelGrid(pixels, palette, target, config_.threads);
    if (built.fallbackCells > 0) {
        std::cerr << "[Converter] WARNING: " << built.fallbackCells
                  << " cells had no palette match and use " << FALLBACK_BLOCK.blockName << "\n";
    }
    if (config_.verbose) {
        std::cout << "[Converter] Generated " << target.x << "x" << target.y << " blocks using "
                  << built.grid.palette().size() << " block types\n";
    }

    auto saved = saveSchematic(built.grid, outputPath, schematicOptions(outputPath));
    if (config_.verbose) {
        std::cout << "[Converter] Wrote " << saved.bytesWritten << " bytes to "
                  << saved.path.string() << "\n";
    }

    ConversionResult result;
    result.outputPath = saved.path;
    result.sourceSize = pixels.size();
    result.size = target;
    result.blockCount = built.grid.volume();
    result.paletteSize = built.grid.palette().size();
    result.fallbackCells = built.fallbackCells;
    result.bytesWritten = saved.bytesWritten;
    return result;
}

glm::ivec2 Converter::resolveTargetSize(glm::ivec2 imageSize,
                                        std::optional<glm::ivec2> requested) const {
    if (!requested) {
        return clampTargetSize(imageSize);
    }
    if (config_.keepAspect) {
        return fitAspectRatio(imageSize, *requested);
    }
    return clampTargetSize(*requested);
}

SchematicOptions Converter::schematicOptions(const std::filesystem::path& outputPath) const {
    SchematicOptions options;
    options.dataVersion = config_.dataVersion;
    options.compress = config_.compress;

    if (config_.writeMetadata) {
        auto now = std::chrono::system_clock::now().time_since_epoch();

        SchematicMetadata meta;
        meta.name = withSchematicExtension(outputPath).stem().string();
        meta.author = config_.author;
        meta.description = config_.description;
        meta.dateMillis = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
        options.metadata = std::move(meta);
    }
    return options;
}

}  // namespace pixschem
