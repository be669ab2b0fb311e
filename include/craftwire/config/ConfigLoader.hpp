#pragma once
// =============================================================================
// ConfigLoader.hpp - INI file parser for craftwire settings
// =============================================================================
// [section] headers, key = value lines, # and ; comments.
// Keys are stored as "section.key".
// =============================================================================

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <istream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace craftwire {

class ConfigLoader {
public:
    ConfigLoader() = default;

    static ConfigLoader& instance() {
        static ConfigLoader inst;
        return inst;
    }

    bool load(const std::string& path = "config.ini") {
        std::vector<std::string> paths = {
            path,
            "../config.ini",
            "../../config.ini",
            std::string(getenv("HOME") ? getenv("HOME") : ".") + "/.config/craftwire/config.ini"
        };

        for (const auto& p : paths) {
            std::ifstream file(p);
            if (file.is_open()) {
                configPath_ = p;
                return parse(file);
            }
        }

        std::cerr << "[CONFIG] ERROR: " << path << " not found\n";
        std::cerr << "[CONFIG] Searched paths:\n";
        for (const auto& p : paths) {
            std::cerr << "  - " << p << "\n";
        }
        return false;
    }

    // Adds to whatever is loaded already; later keys win.
    bool parse(std::istream& in) {
        std::string line;
        std::string currentSection;

        while (std::getline(in, line)) {
            size_t start = line.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) continue;
            line = line.substr(start);

            size_t end = line.find_last_not_of(" \t\r\n");
            if (end != std::string::npos) {
                line = line.substr(0, end + 1);
            }

            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                size_t closePos = line.find(']');
                if (closePos != std::string::npos) {
                    currentSection = line.substr(1, closePos - 1);
                }
                continue;
            }

            size_t eqPos = line.find('=');
            if (eqPos == std::string::npos) {
                std::cerr << "[CONFIG] ignoring line without '=': " << line << "\n";
                continue;
            }

            std::string key = line.substr(0, eqPos);
            std::string value = line.substr(eqPos + 1);

            end = key.find_last_not_of(" \t");
            if (end != std::string::npos) key = key.substr(0, end + 1);

            start = value.find_first_not_of(" \t");
            value = start == std::string::npos ? std::string() : value.substr(start);
            end = value.find_last_not_of(" \t\r\n");
            if (end != std::string::npos) value = value.substr(0, end + 1);

            values_[currentSection + "." + key] = value;
        }

        return !values_.empty();
    }

    std::string get(const std::string& section, const std::string& key, const std::string& defaultVal = "") const {
        auto it = values_.find(section + "." + key);
        if (it != values_.end()) {
            return it->second;
        }
        return defaultVal;
    }

    bool has(const std::string& section, const std::string& key) const {
        return values_.count(section + "." + key) != 0;
    }

    // Unparsable numbers fall back to the default with a warning.
    long long getInt(const std::string& section, const std::string& key, long long defaultVal = 0) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        try {
            size_t used = 0;
            long long v = std::stoll(val, &used, 0);
            if (used != val.size()) throw std::invalid_argument(val);
            return v;
        } catch (const std::invalid_argument&) {
            std::cerr << "[CONFIG] " << section << "." << key << " = " << val
                      << " is not an integer, using " << defaultVal << "\n";
        } catch (const std::out_of_range&) {
            std::cerr << "[CONFIG] " << section << "." << key << " = " << val
                      << " is out of range, using " << defaultVal << "\n";
        }
        return defaultVal;
    }

    bool getBool(const std::string& section, const std::string& key, bool defaultVal = false) const {
        std::string val = get(section, key);
        if (val.empty()) return defaultVal;
        return (val == "true" || val == "1" || val == "yes" || val == "on");
    }

    const std::string& getConfigPath() const { return configPath_; }
    size_t size() const { return values_.size(); }

    void clear() {
        values_.clear();
        configPath_.clear();
    }

    void dump(std::ostream& out = std::cout) const {
        out << "[CONFIG] Loaded from: " << (configPath_.empty() ? "<memory>" : configPath_) << "\n";
        for (const auto& kv : values_) {
            if (kv.first.find("password") != std::string::npos ||
                kv.first.find("secret") != std::string::npos) {
                out << "  " << kv.first << " = ********\n";
            } else {
                out << "  " << kv.first << " = " << kv.second << "\n";
            }
        }
    }

private:
    std::unordered_map<std::string, std::string> values_;
    std::string configPath_;
};

} // namespace craftwire
