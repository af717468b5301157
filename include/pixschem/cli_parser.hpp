#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pixschem {

// Small command-line parser:
//   --key value   (for keys registered with valueOptions)
//   --flag        (anything else, treated as "true")
//   positional arguments are kept in order
class CliParser {
public:
    explicit CliParser(std::unordered_set<std::string> valueOptions = {})
        : valueOptions_(std::move(valueOptions)) {}

    // Throws std::invalid_argument if a value option has no value
    void parse(int argc, const char* const* argv);

    [[nodiscard]] bool has(const std::string& key) const;
    [[nodiscard]] std::string get(const std::string& key, const std::string& def = "") const;
    [[nodiscard]] const std::vector<std::string>& positional() const { return positional_; }

private:
    std::unordered_set<std::string> valueOptions_;
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

}  // namespace pixschem
