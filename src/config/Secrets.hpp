#pragma once
#include <string>

namespace canopy {

// Load credentials and endpoint overrides from environment variables
// (NOT from canopy.ini)
class Secrets {
public:
    static std::string get(const std::string& key);
    static std::string getRequired(const std::string& key);

    // Environment value when set, otherwise the fallback.
    static std::string getOr(const std::string& key, const std::string& fallback);
};

} // namespace canopy
