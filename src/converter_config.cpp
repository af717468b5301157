#include "pixschem/converter_config.hpp"
#include "pixschem/core/errors.hpp"

#include <algorithm>

namespace pixschem {

void ConverterConfig::apply(const ConfigDocument& doc) {
    if (auto* entry = doc.get("palette_dir"); entry && !entry->value.empty()) {
        paletteDir = entry->value.asStringOwned();
    }

    if (doc.get("blocks")) {
        blocks = doc.getList("blocks");
    }

    threads = static_cast<size_t>(std::max(0, doc.getInt("threads", static_cast<int>(threads))));
    compress = doc.getBool("compress", compress);
    dataVersion = doc.getInt("data_version", dataVersion);
    writeMetadata = doc.getBool("metadata", writeMetadata);
    author = std::string(doc.getString("author", author));
    description = std::string(doc.getString("description", description));
    keepAspect = doc.getBool("keep_aspect", keepAspect);
    verbose = doc.getBool("verbose", verbose);
}

ConverterConfig ConverterConfig::fromFile(const std::filesystem::path& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path.string());
    if (!doc) {
        throw ConversionError("Cannot read config file: " + path.string());
    }

    ConverterConfig config;
    config.apply(*doc);
    return config;
}

}  // namespace pixschem
