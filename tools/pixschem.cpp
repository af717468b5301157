/**
 * @file pixschem.cpp
 * @brief Command-line front end: image -> Sponge schematic
 */

#include "pixschem/cli_parser.hpp"
#include "pixschem/converter.hpp"
#include "pixschem/io/palette_loader.hpp"
#include "pixschem/io/schematic_io.hpp"

#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

using namespace pixschem;

namespace {

constexpr const char* USAGE =
    "Usage: pixschem [options] <input_image> <output_schem> [width height]\n"
    "Example: pixschem image.png output.schem 64 64\n"
    "\n"
    "Options:\n"
    "  --config <file>       Read settings from a config file\n"
    "  --palette-dir <dir>   Directory with <name>.json palette sources\n"
    "  --blocks <a,b,...>    Palette sources to use (default: wool,concrete)\n"
    "  --threads <n>         Classification threads (0 = all cores)\n"
    "  --no-compress         Write uncompressed NBT\n"
    "  --no-metadata         Omit the Metadata compound\n"
    "  --keep-aspect         Fit width/height to the image aspect ratio\n"
    "  --verbose             Log each pipeline stage\n"
    "  --list-blocks         List available palette sources and exit\n"
    "  --inspect <file>      Print a schematic's dimensions and palette and exit\n"
    "  --help                Show this message\n";

std::optional<int> parseInt(const std::string& text) {
    int value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

int usageError(const std::string& message) {
    std::cerr << "[pixschem] ERROR: " << message << "\n\n" << USAGE;
    return 1;
}

void listBlocks(const ConverterConfig& config) {
    auto sources = listPaletteSources(config.paletteDir);
    std::cout << "Palette sources in " << config.paletteDir.string() << ":\n";
    for (const auto& source : sources) {
        std::cout << "  " << source.name;
        if (source.displayName != source.name) {
            std::cout << " (" << source.displayName << ")";
        }
        std::cout << "\n";
    }
}

void inspect(const std::string& path) {
    auto schematic = loadSchematic(path);
    const auto& grid = schematic.grid;

    std::cout << path << ": Sponge schematic v" << schematic.version
              << ", data version " << schematic.dataVersion << "\n";
    std::cout << "Size: " << grid.width() << " x " << grid.depth() << " x " << grid.height()
              << " (W x H x L)\n";
    if (schematic.metadata) {
        std::cout << "Name: " << schematic.metadata->name << "\n";
        std::cout << "Author: " << schematic.metadata->author << "\n";
    }

    auto counts = grid.usageCounts();
    std::cout << "Palette (" << grid.palette().size() << "):\n";
    for (size_t id = 0; id < grid.palette().size(); ++id) {
        std::cout << "  " << id << ": " << grid.palette().names()[id] << " x" << counts[id] << "\n";
    }
}

}  // namespace

int main(int argc, char** argv) {
    CliParser cli({"config", "palette-dir", "blocks", "threads", "inspect"});
    try {
        cli.parse(argc, argv);
    } catch (const std::invalid_argument& e) {
        return usageError(e.what());
    }

    if (cli.has("help")) {
        std::cout << USAGE;
        return 0;
    }

    try {
        ConverterConfig config;
        if (cli.has("config")) {
            config = ConverterConfig::fromFile(cli.get("config"));
        }

        // Command-line options override the config file
        if (cli.has("palette-dir")) config.paletteDir = cli.get("palette-dir");
        if (cli.has("blocks")) config.blocks = ConfigValue(cli.get("blocks")).asList();
        if (cli.has("threads")) {
            auto threads = parseInt(cli.get("threads"));
            if (!threads || *threads < 0) {
                return usageError("--threads expects a non-negative integer");
            }
            config.threads = static_cast<size_t>(*threads);
        }
        if (cli.has("no-compress")) config.compress = false;
        if (cli.has("no-metadata")) config.writeMetadata = false;
        if (cli.has("keep-aspect")) config.keepAspect = true;
        if (cli.has("verbose")) config.verbose = true;

        if (cli.has("list-blocks")) {
            listBlocks(config);
            return 0;
        }
        if (cli.has("inspect")) {
            inspect(cli.get("inspect"));
            return 0;
        }

        const auto& args = cli.positional();
        if (args.size() != 2 && args.size() != 4) {
            return usageError(args.size() == 3 ? "width and height must be given together"
                                               : "expected an input image and an output path");
        }

        std::optional<glm::ivec2> size;
        if (args.size() == 4) {
            auto width = parseInt(args[2]);
            auto height = parseInt(args[3]);
            if (!width || !height) {
                return usageError("width and height must be integers");
            }
            size = glm::ivec2(*width, *height);
        }

        Converter converter(config);
        auto result = converter.convert(args[0], args[1], size);

        std::cout << "Successfully converted " << args[0] << " to " << result.outputPath.string() << "\n";
        std::cout << "Dimensions: " << result.size.x << " x " << result.size.y << " blocks\n";
        std::cout << "Block types: " << result.paletteSize << ", total blocks: " << result.blockCount << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[pixschem] ERROR: " << e.what() << "\n";
        return 1;
    }
}
