#pragma once
// =============================================================================
// ConfigLoader.hpp - canopy.ini reader
// =============================================================================
// [section] headers, "key = value" lines, '#' and ';' comments. Values are
// kept as text and converted by the typed getters. Credentials come from the
// environment (see Secrets.hpp), never from this file.
// =============================================================================

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace canopy {

class ConfigLoader {
public:
    // First readable of: path, ../path, ~/.config/canopy/canopy.ini
    bool load(const std::string& path = "canopy.ini") {
        const char* home = std::getenv("HOME");
        std::vector<std::string> candidates = {
            path,
            "../" + path,
            std::string(home ? home : ".") + "/.config/canopy/canopy.ini"
        };

        for (const auto& p : candidates) {
            std::ifstream file(p);
            if (!file.is_open()) continue;
            source_ = p;
            return parse(file);
        }

        std::cerr << "[CONFIG] " << path << " not found (searched:";
        for (const auto& p : candidates) std::cerr << " " << p;
        std::cerr << ")\n";
        return false;
    }

    bool loadFromString(const std::string& text) {
        std::istringstream in(text);
        source_ = "<memory>";
        return parse(in);
    }

    bool has(const std::string& section, const std::string& key) const {
        return values_.count(section + "." + key) > 0;
    }

    std::string get(const std::string& section, const std::string& key,
                    const std::string& fallback = "") const {
        auto it = values_.find(section + "." + key);
        return it == values_.end() ? fallback : it->second;
    }

    int getInt(const std::string& section, const std::string& key, int fallback = 0) const {
        std::string text = get(section, key);
        if (text.empty()) return fallback;
        size_t used = 0;
        int n = 0;
        try {
            n = std::stoi(text, &used);
        } catch (const std::exception&) {
            used = 0;   // reported below
        }
        if (used == text.size()) return n;
        std::cerr << "[CONFIG] " << section << "." << key << " is not an integer: '" << text << "'\n";
        return fallback;
    }

    bool getBool(const std::string& section, const std::string& key, bool fallback = false) const {
        std::string text = get(section, key);
        if (text.empty()) return fallback;
        return text == "true" || text == "1" || text == "yes" || text == "on";
    }

    // Settings as loaded, credential-looking keys masked.
    void dump() const {
        std::cout << "[CONFIG] " << source_ << "\n";
        for (const auto& kv : values_) {
            std::cout << "  " << kv.first << " = "
                      << (sensitive(kv.first) ? "********" : kv.second) << "\n";
        }
    }

private:
    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    static bool sensitive(const std::string& key) {
        for (const char* word : {"password", "secret", "token"}) {
            if (key.find(word) != std::string::npos) return true;
        }
        return false;
    }

    bool parse(std::istream& in) {
        std::string section;
        std::string raw;
        while (std::getline(in, raw)) {
            std::string line = trim(raw);
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            if (line[0] == '[') {
                size_t close = line.find(']');
                if (close != std::string::npos) section = trim(line.substr(1, close - 1));
                continue;
            }

            size_t eq = line.find('=');
            if (eq == std::string::npos) continue;
            values_[section + "." + trim(line.substr(0, eq))] = trim(line.substr(eq + 1));
        }
        return !values_.empty();
    }

    std::map<std::string, std::string> values_;   // "section.key" -> value
    std::string source_;
};

} // namespace canopy
