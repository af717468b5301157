#include "pixschem/cli_parser.hpp"

#include <stdexcept>

namespace pixschem {

void CliParser::parse(int argc, const char* const* argv) {
    kv_.clear();
    positional_.clear();

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind("--", 0) != 0 || a.size() == 2) {
            positional_.push_back(a);
            continue;
        }

        std::string key = a.substr(2);
        std::string val = "true";

        auto eq = key.find('=');
        if (eq != std::string::npos) {
            val = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else if (valueOptions_.contains(key)) {
            if (i + 1 >= argc || !argv[i + 1]) {
                throw std::invalid_argument("Option --" + key + " requires a value");
            }
            val = argv[++i];
        }
        kv_[key] = val;
    }
}

bool CliParser::has(const std::string& key) const {
    return kv_.find(key) != kv_.end();
}

std::string CliParser::get(const std::string& key, const std::string& def) const {
    auto it = kv_.find(key);
    if (it == kv_.end()) return def;
    return it->second;
}

}  // namespace pixschem
