#include "pixschem/config_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace pixschem {

namespace {

constexpr int MAX_INCLUDE_DEPTH = 16;

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

void splitWords(std::string_view text, std::vector<std::string>& out) {
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() &&
               (std::isspace(static_cast<unsigned char>(text[pos])) || text[pos] == ',')) {
            pos++;
        }
        size_t start = pos;
        while (pos < text.size() &&
               !std::isspace(static_cast<unsigned char>(text[pos])) && text[pos] != ',') {
            pos++;
        }
        if (pos > start) {
            out.emplace_back(text.substr(start, pos - start));
        }
    }
}

}  // namespace

// ============================================================================
// ConfigValue
// ============================================================================

bool ConfigValue::asBool(bool defaultVal) const {
    if (text_.empty()) return defaultVal;

    if (text_ == "true" || text_ == "yes" || text_ == "1" ||
        text_ == "on" || text_ == "t" || text_ == "y") {
        return true;
    }
    if (text_ == "false" || text_ == "no" || text_ == "0" ||
        text_ == "off" || text_ == "f" || text_ == "n") {
        return false;
    }
    return defaultVal;
}

int ConfigValue::asInt(int defaultVal) const {
    if (text_.empty()) return defaultVal;

    char* end;
    long val = std::strtol(text_.c_str(), &end, 10);
    if (end == text_.c_str()) return defaultVal;
    return static_cast<int>(val);
}

std::vector<std::string> ConfigValue::asList() const {
    std::vector<std::string> words;
    splitWords(text_, words);
    return words;
}

// ============================================================================
// ConfigDocument
// ============================================================================

void ConfigDocument::addEntry(ConfigEntry entry) {
    entries_.push_back(std::move(entry));
}

const ConfigEntry* ConfigDocument::get(std::string_view key) const {
    // Return last entry with this key (later overrides earlier)
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string_view ConfigDocument::getString(std::string_view key, std::string_view defaultVal) const {
    if (auto* entry = get(key)) {
        auto sv = entry->value.asString();
        if (!sv.empty()) return sv;
    }
    return defaultVal;
}

int ConfigDocument::getInt(std::string_view key, int defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asInt(defaultVal);
    }
    return defaultVal;
}

bool ConfigDocument::getBool(std::string_view key, bool defaultVal) const {
    if (auto* entry = get(key)) {
        return entry->value.asBool(defaultVal);
    }
    return defaultVal;
}

std::vector<std::string> ConfigDocument::getList(std::string_view key) const {
    std::vector<std::string> words;
    for (const auto& entry : entries_) {
        if (entry.key != key) continue;
        splitWords(entry.value.asString(), words);
        for (const auto& item : entry.items) {
            splitWords(item, words);
        }
    }
    return words;
}

// ============================================================================
// ConfigParser
// ============================================================================

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path) const {
    return parseFile(path, 0);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath) const {
    return parseString(content, basePath, 0);
}

std::optional<ConfigDocument> ConfigParser::parseFile(const std::string& path, int depth) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // Extract base path for relative includes
    std::string basePath;
    auto lastSlash = path.find_last_of("/\\");
    if (lastSlash != std::string::npos) {
        basePath = path.substr(0, lastSlash + 1);
    }

    return parseString(buffer.str(), basePath, depth);
}

ConfigDocument ConfigParser::parseString(std::string_view content, const std::string& basePath,
                                         int depth) const {
    ConfigDocument doc;
    ConfigEntry currentEntry;

    std::string_view remaining = content;

    while (!remaining.empty()) {
        auto lineEnd = remaining.find('\n');
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = remaining;
            remaining = {};
        } else {
            line = remaining.substr(0, lineEnd);
            remaining = remaining.substr(lineEnd + 1);
        }

        // Remove trailing \r if present (Windows line endings)
        if (!line.empty() && line.back() == '\r') {
            line = line.substr(0, line.size() - 1);
        }

        parseLine(line, currentEntry, doc, basePath, depth);
    }

    flushEntry(currentEntry, doc);

    return doc;
}

void ConfigParser::parseLine(std::string_view line, ConfigEntry& currentEntry,
                             ConfigDocument& doc, const std::string& basePath, int depth) const {
    if (trim(line).empty()) {
        return;
    }

    // Indented line: item of the current entry
    if (std::isspace(static_cast<unsigned char>(line[0]))) {
        auto item = trim(line);
        if (!currentEntry.key.empty() && item.front() != '#') {
            currentEntry.items.emplace_back(item);
        }
        return;
    }

    flushEntry(currentEntry, doc);
    currentEntry = ConfigEntry{};

    if (line[0] == '#') {
        return;
    }

    auto colonPos = line.find(':');
    if (colonPos == std::string_view::npos) {
        // No colon - treat as simple key with no value
        currentEntry.key = std::string(trim(line));
        return;
    }

    currentEntry.key = std::string(trim(line.substr(0, colonPos)));

    // Later colons belong to the value
    auto rest = trim(line.substr(colonPos + 1));

    if (currentEntry.key == "include") {
        std::string includePath(rest);
        currentEntry = ConfigEntry{};  // Don't add include as entry

        if (depth >= MAX_INCLUDE_DEPTH) {
            std::cerr << "[ConfigParser] WARNING: include depth exceeded at '" << includePath << "'\n";
            return;
        }

        std::string resolvedPath = includeResolver_ ? includeResolver_(includePath)
                                                    : basePath + includePath;

        if (auto includedDoc = parseFile(resolvedPath, depth + 1)) {
            for (const auto& entry : *includedDoc) {
                doc.addEntry(entry);
            }
        } else {
            std::cerr << "[ConfigParser] WARNING: Cannot open include '" << resolvedPath << "'\n";
        }
        return;
    }

    if (!rest.empty()) {
        currentEntry.value = ConfigValue(rest);
    }
}

void ConfigParser::flushEntry(ConfigEntry& entry, ConfigDocument& doc) const {
    if (!entry.key.empty()) {
        doc.addEntry(std::move(entry));
        entry = ConfigEntry{};
    }
}

}  // namespace pixschem
