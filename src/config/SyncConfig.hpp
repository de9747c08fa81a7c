#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/ConfigLoader.hpp"

namespace canopy {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct OdooConfig {
    std::string url;
    std::string db;
    std::string username;
    std::string password;     // password or API key
    long timeout_seconds = 30;
    int  max_retries = 3;

    // Names of missing required settings (empty when complete).
    std::vector<std::string> missing() const;
};

struct SankhyaConfig {
    std::string base_url = "https://api.sankhya.com.br";
    std::string client_id;
    std::string client_secret;
    std::string x_token;
    long timeout_seconds = 60;
    int  max_retries = 3;

    std::vector<std::string> missing() const;
};

// Per-hierarchy settings ([categories] / [locations] sections).
struct ProfileConfig {
    std::string sql_path;
    std::optional<int64_t> anchor_id;
};

struct SyncConfig {
    OdooConfig odoo;
    SankhyaConfig sankhya;
    ProfileConfig categories;
    ProfileConfig locations;

    bool require_key_field = false;
    bool verbose = false;

    const ProfileConfig& profile(const std::string& name) const;

    // INI values first, environment overrides on top.
    static SyncConfig from(const ConfigLoader& ini);
};

} // namespace canopy
