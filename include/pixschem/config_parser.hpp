#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pixschem {

// ============================================================================
// ConfigValue - A parsed configuration value
// ============================================================================

/**
 * @brief A configuration value: the text after the colon
 */
class ConfigValue {
public:
    ConfigValue() = default;
    explicit ConfigValue(std::string_view text) : text_(text) {}

    // String access
    [[nodiscard]] std::string_view asString() const { return text_; }
    [[nodiscard]] std::string asStringOwned() const { return text_; }

    // Boolean access
    [[nodiscard]] bool asBool(bool defaultVal = false) const;

    // Numeric access
    [[nodiscard]] int asInt(int defaultVal = 0) const;

    // Words separated by whitespace and/or commas
    [[nodiscard]] std::vector<std::string> asList() const;

    [[nodiscard]] bool empty() const { return text_.empty(); }

private:
    std::string text_;
};

// ============================================================================
// ConfigEntry - A key-value pair with optional item lines
// ============================================================================

/**
 * @brief A configuration entry
 *
 * Represents entries like:
 *   key: value
 *   key:
 *       item one
 *       item two
 */
struct ConfigEntry {
    std::string key;                 // e.g. "blocks", "threads"
    ConfigValue value;               // Everything after the first colon
    std::vector<std::string> items;  // Indented item lines, trimmed
};

// ============================================================================
// ConfigDocument - A parsed configuration file
// ============================================================================

/**
 * @brief A parsed configuration document
 *
 * Contains all entries from a config file, in order. Multiple entries with
 * the same key are kept; simple lookups return the last one.
 */
class ConfigDocument {
public:
    ConfigDocument() = default;

    void addEntry(ConfigEntry entry);

    // Lookup by key (returns last entry with this key, or nullptr)
    [[nodiscard]] const ConfigEntry* get(std::string_view key) const;

    // Get value directly (convenience)
    [[nodiscard]] std::string_view getString(std::string_view key, std::string_view defaultVal = "") const;
    [[nodiscard]] int getInt(std::string_view key, int defaultVal = 0) const;
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    // Words from every entry with this key: inline values and item lines, in order
    [[nodiscard]] std::vector<std::string> getList(std::string_view key) const;

    // Iteration
    [[nodiscard]] const std::vector<ConfigEntry>& entries() const { return entries_; }
    [[nodiscard]] auto begin() const { return entries_.begin(); }
    [[nodiscard]] auto end() const { return entries_.end(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }
    [[nodiscard]] size_t size() const { return entries_.size(); }

private:
    std::vector<ConfigEntry> entries_;
};

// ============================================================================
// ConfigParser - Parses configuration files
// ============================================================================

/**
 * @brief Parser for simple configuration files
 *
 * Format:
 * ```
 * # Comments start with #
 * palette_dir: block
 * blocks: wool, concrete
 * blocks:
 *     terracotta
 * include: other_file.conf
 * ```
 *
 * Indented lines are items of the entry above them. An `include:` directive
 * parses the named file (relative to the including file unless a resolver is
 * set) and inserts its entries at that point, so later lines override it.
 */
class ConfigParser {
public:
    using IncludeResolver = std::function<std::string(const std::string&)>;

    ConfigParser() = default;

    void setIncludeResolver(IncludeResolver resolver) { includeResolver_ = std::move(resolver); }

    /**
     * @brief Parse a configuration file
     * @param path Filesystem path to the file
     * @return Parsed document, or nullopt if the file cannot be opened
     */
    [[nodiscard]] std::optional<ConfigDocument> parseFile(const std::string& path) const;

    /**
     * @brief Parse configuration from a string
     * @param content The configuration content
     * @param basePath Base path for resolving includes (optional)
     */
    [[nodiscard]] ConfigDocument parseString(std::string_view content,
                                             const std::string& basePath = "") const;

private:
    void parseLine(std::string_view line, ConfigEntry& currentEntry,
                   ConfigDocument& doc, const std::string& basePath, int depth) const;

    ConfigDocument parseString(std::string_view content, const std::string& basePath, int depth) const;
    std::optional<ConfigDocument> parseFile(const std::string& path, int depth) const;

    void flushEntry(ConfigEntry& entry, ConfigDocument& doc) const;

    IncludeResolver includeResolver_;
};

}  // namespace pixschem
