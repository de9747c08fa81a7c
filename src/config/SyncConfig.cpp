#include "config/SyncConfig.hpp"
#include "config/Secrets.hpp"

using namespace canopy;

static ProfileConfig read_profile(const ConfigLoader& ini,
                                  const std::string& section,
                                  const std::string& default_sql) {
    ProfileConfig p;
    p.sql_path = ini.get(section, "sql", default_sql);
    int anchor = ini.getInt(section, "anchor_id", 0);
    if (anchor > 0) p.anchor_id = anchor;
    return p;
}

std::vector<std::string> OdooConfig::missing() const {
    std::vector<std::string> out;
    if (url.empty())      out.push_back("ODOO_URL");
    if (db.empty())       out.push_back("ODOO_DB");
    if (username.empty()) out.push_back("ODOO_USERNAME");
    if (password.empty()) out.push_back("ODOO_PASSWORD");
    return out;
}

std::vector<std::string> SankhyaConfig::missing() const {
    std::vector<std::string> out;
    if (base_url.empty())      out.push_back("SANKHYA_BASE_URL");
    if (client_id.empty())     out.push_back("SANKHYA_CLIENT_ID");
    if (client_secret.empty()) out.push_back("SANKHYA_CLIENT_SECRET");
    return out;
}

const ProfileConfig& SyncConfig::profile(const std::string& name) const {
    if (name == "categories") return categories;
    if (name == "locations")  return locations;
    throw ConfigError("Unknown hierarchy profile: " + name);
}

SyncConfig SyncConfig::from(const ConfigLoader& ini) {
    SyncConfig cfg;

    cfg.odoo.url             = Secrets::getOr("ODOO_URL",      ini.get("odoo", "url"));
    cfg.odoo.db              = Secrets::getOr("ODOO_DB",       ini.get("odoo", "db"));
    cfg.odoo.username        = Secrets::getOr("ODOO_USERNAME", ini.get("odoo", "username"));
    cfg.odoo.password        = Secrets::get("ODOO_PASSWORD");
    cfg.odoo.timeout_seconds = ini.getInt("odoo", "timeout_seconds", 30);
    cfg.odoo.max_retries     = ini.getInt("odoo", "retries", 3);

    cfg.sankhya.base_url        = Secrets::getOr("SANKHYA_BASE_URL",
                                      ini.get("sankhya", "base_url", cfg.sankhya.base_url));
    cfg.sankhya.client_id       = Secrets::get("SANKHYA_CLIENT_ID");
    cfg.sankhya.client_secret   = Secrets::get("SANKHYA_CLIENT_SECRET");
    cfg.sankhya.x_token         = Secrets::get("SANKHYA_TOKEN");
    cfg.sankhya.timeout_seconds = ini.getInt("sankhya", "timeout_seconds", 60);
    cfg.sankhya.max_retries     = ini.getInt("sankhya", "retries", 3);

    cfg.categories = read_profile(ini, "categories", "sql/grupos.sql");
    cfg.locations  = read_profile(ini, "locations",  "sql/locais.sql");

    cfg.require_key_field = ini.getBool("sync", "require_key_field", false);
    cfg.verbose           = ini.getBool("sync", "verbose", false);

    if (cfg.odoo.timeout_seconds <= 0) {
        throw ConfigError("odoo.timeout_seconds must be positive");
    }
    if (cfg.odoo.max_retries < 1 || cfg.sankhya.max_retries < 1) {
        throw ConfigError("retries must be at least 1");
    }
    return cfg;
}
