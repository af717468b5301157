#include "pixschem/io/palette_loader.hpp"
#include "pixschem/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

namespace pixschem {

namespace {

constexpr const char* SOURCE_EXTENSION = ".json";

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::optional<BlockMapping> parseBlockMapping(const nlohmann::ordered_json& value) {
    const nlohmann::ordered_json* name = nullptr;
    const nlohmann::ordered_json* data = nullptr;

    if (value.is_object()) {
        auto nameIt = value.find("block_name");
        auto dataIt = value.find("block_data");
        if (nameIt == value.end() || dataIt == value.end()) return std::nullopt;
        name = &*nameIt;
        data = &*dataIt;
    } else if (value.is_array() && value.size() >= 2) {
        name = &value[0];
        data = &value[1];
    } else {
        return std::nullopt;
    }

    if (!name->is_string() || !data->is_number()) {
        return std::nullopt;
    }

    auto blockData = data->get<double>();
    if (blockData < 0 || blockData > INT32_MAX) {
        return std::nullopt;
    }

    auto blockName = name->get<std::string>();
    if (blockName.empty()) {
        return std::nullopt;
    }

    return BlockMapping{std::move(blockName), static_cast<int32_t>(blockData)};
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

std::optional<Color> parseColorKey(std::string_view key) {
    key = trim(key);
    if (!key.empty() && key.front() == '(') key.remove_prefix(1);
    if (!key.empty() && key.back() == ')') key.remove_suffix(1);

    int channels[3] = {0, 0, 0};
    for (int i = 0; i < 3; ++i) {
        auto comma = key.find(',');
        std::string_view part = trim(key.substr(0, comma));

        int value = 0;
        auto [end, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc() || end != part.data() + part.size() || value < 0 || value > 255) {
            return std::nullopt;
        }
        channels[i] = value;

        if (comma == std::string_view::npos) {
            if (i < 2) return std::nullopt;
            key = {};
        } else if (i == 2) {
            return std::nullopt;  // more than three channels
        } else {
            key = key.substr(comma + 1);
        }
    }

    return Color(static_cast<uint8_t>(channels[0]),
                 static_cast<uint8_t>(channels[1]),
                 static_cast<uint8_t>(channels[2]));
}

std::string stripCommentLines(std::string_view content) {
    std::string result;
    result.reserve(content.size());

    while (!content.empty()) {
        auto lineEnd = content.find('\n');
        std::string_view line = content.substr(0, lineEnd);
        content = lineEnd == std::string_view::npos ? std::string_view{} : content.substr(lineEnd + 1);

        auto stripped = trim(line);
        if (!stripped.empty() && stripped.front() == '#') {
            continue;
        }
        result.append(line);
        result.push_back('\n');
    }
    return result;
}

std::optional<std::vector<PaletteEntry>> parsePaletteSource(std::string_view content) {
    auto json = nlohmann::ordered_json::parse(stripCommentLines(content), nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return std::nullopt;
    }

    std::vector<PaletteEntry> entries;
    entries.reserve(json.size());

    for (const auto& item : json.items()) {
        auto color = parseColorKey(item.key());
        if (!color) continue;

        auto mapping = parseBlockMapping(item.value());
        if (!mapping) continue;

        entries.push_back(PaletteEntry{*color, std::move(*mapping)});
    }
    return entries;
}

PaletteIndex loadPaletteSources(const std::filesystem::path& paletteDir,
                                std::span<const std::string> sources,
                                const PaletteLoadOptions& options) {
    if (!std::filesystem::is_directory(paletteDir)) {
        throw PaletteSourceMissing("Palette directory does not exist: " + paletteDir.string());
    }

    std::vector<PaletteEntry> entries;

    for (const auto& source : sources) {
        auto path = paletteDir / (source + SOURCE_EXTENSION);
        if (!std::filesystem::is_regular_file(path)) {
            throw PaletteSourceMissing("Palette source '" + source + "' not found at " + path.string());
        }

        auto content = readFile(path);
        if (!content) {
            std::cerr << "[PaletteLoader] WARNING: Cannot read " << path << ", skipped\n";
            continue;
        }

        auto parsed = parsePaletteSource(*content);
        if (!parsed) {
            std::cerr << "[PaletteLoader] WARNING: " << path << " is not a JSON object, skipped\n";
            continue;
        }

        if (options.verbose) {
            std::cout << "[PaletteLoader] Loaded " << parsed->size() << " colors from " << source << "\n";
        }
        entries.insert(entries.end(), std::make_move_iterator(parsed->begin()),
                       std::make_move_iterator(parsed->end()));
    }

    if (entries.empty()) {
        throw BlockMappingParseError("No block mappings loaded from " + paletteDir.string());
    }

    PaletteIndex index;
    index.load(entries);

    if (options.verbose) {
        std::cout << "[PaletteLoader] " << index.size() << " distinct colors in palette\n";
    }
    return index;
}

std::vector<PaletteSourceInfo> listPaletteSources(const std::filesystem::path& paletteDir) {
    if (!std::filesystem::is_directory(paletteDir)) {
        throw PaletteSourceMissing("Palette directory does not exist: " + paletteDir.string());
    }

    std::vector<PaletteSourceInfo> sources;
    for (const auto& entry : std::filesystem::directory_iterator(paletteDir)) {
        if (!entry.is_regular_file() || entry.path().extension() != SOURCE_EXTENSION) {
            continue;
        }

        PaletteSourceInfo info;
        info.name = entry.path().stem().string();
        info.displayName = info.name;

        std::ifstream file(entry.path());
        std::string firstLine;
        if (file && std::getline(file, firstLine)) {
            auto line = trim(firstLine);
            if (line.starts_with("# ") && line.size() > 2) {
                info.displayName = std::string(trim(line.substr(2)));
            }
        }
        sources.push_back(std::move(info));
    }

    std::sort(sources.begin(), sources.end(),
              [](const PaletteSourceInfo& a, const PaletteSourceInfo& b) { return a.name < b.name; });
    return sources;
}

}  // namespace pixschem
