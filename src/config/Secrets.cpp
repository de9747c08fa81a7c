#include "config/Secrets.hpp"
#include "config/SyncConfig.hpp"
#include <cstdlib>

namespace canopy {

std::string Secrets::get(const std::string& key) {
    const char* val = std::getenv(key.c_str());
    return val ? std::string(val) : "";
}

std::string Secrets::getRequired(const std::string& key) {
    std::string val = get(key);
    if (val.empty()) {
        throw ConfigError("Required environment variable not set: " + key);
    }
    return val;
}

std::string Secrets::getOr(const std::string& key, const std::string& fallback) {
    std::string val = get(key);
    return val.empty() ? fallback : val;
}

} // namespace canopy
