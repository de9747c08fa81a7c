#include "source/SankhyaGatewayReader.hpp"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace canopy;
using json = nlohmann::json;

static const char* QUERY_SERVICE = "DbExplorerSP.executeQuery";

static std::string form_escape(const std::string& in) {
    std::string out;
    for (unsigned char c : in) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

SankhyaGatewayReader::SankhyaGatewayReader(const SankhyaConfig& cfg, std::string sql)
    : cfg_(cfg),
      sql_(std::move(sql)),
      http_(std::make_unique<HttpClient>(cfg.timeout_seconds, cfg.max_retries)) {}

std::string SankhyaGatewayReader::load_sql(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw SourceError("[SANKHYA] SQL file not found: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    std::string sql = trim(ss.str());
    if (sql.empty()) {
        throw SourceError("[SANKHYA] SQL file is empty: " + path);
    }
    return sql;
}

void SankhyaGatewayReader::authenticate() {
    auto missing = cfg_.missing();
    if (!missing.empty()) {
        std::string names;
        for (const auto& m : missing) names += (names.empty() ? "" : ", ") + m;
        throw SourceError("[SANKHYA] Missing credentials: " + names);
    }

    std::string body = "grant_type=client_credentials"
                       "&client_id=" + form_escape(cfg_.client_id) +
                       "&client_secret=" + form_escape(cfg_.client_secret);
    std::vector<std::string> headers = {"Content-Type: application/x-www-form-urlencoded",
                                        "Accept: application/json"};
    if (!cfg_.x_token.empty()) headers.push_back("X-Token: " + cfg_.x_token);

    HttpResponse resp;
    try {
        resp = http_->post(cfg_.base_url + "/authenticate", body, headers);
    } catch (const HttpError& e) {
        throw SourceError(std::string("[SANKHYA] Authentication failed: ") + e.what());
    }

    json reply;
    try {
        reply = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throw SourceError(std::string("[SANKHYA] Authentication reply parse failed: ") + e.what());
    }
    if (!reply.contains("access_token") || !reply["access_token"].is_string()) {
        throw SourceError("[SANKHYA] Authentication reply without access_token");
    }
    bearer_ = reply["access_token"].get<std::string>();
    std::cout << "[SANKHYA] Authenticated at " << cfg_.base_url << "\n";
}

std::vector<json> SankhyaGatewayReader::parse_query_reply(const json& reply) {
    if (!reply.is_object()) {
        throw SourceError("[SANKHYA] Malformed gateway reply");
    }
    if (reply.contains("status")) {
        std::string status = reply["status"].is_string()
            ? reply["status"].get<std::string>()
            : reply["status"].dump();
        if (status != "1") {
            throw SourceError("[SANKHYA] " + reply.value("statusMessage", std::string("query failed")));
        }
    }

    const json& body = reply.contains("responseBody") ? reply["responseBody"] : reply;
    if (!body.contains("fieldsMetadata") || !body["fieldsMetadata"].is_array()) {
        throw SourceError("[SANKHYA] Reply without fieldsMetadata");
    }

    std::vector<std::string> columns;
    for (const auto& f : body["fieldsMetadata"]) {
        columns.push_back(f.value("name", std::string()));
    }

    std::vector<json> rows;
    if (!body.contains("rows") || !body["rows"].is_array()) return rows;

    for (const auto& r : body["rows"]) {
        if (!r.is_array()) {
            throw SourceError("[SANKHYA] Row is not a list: " + r.dump());
        }
        json row = json::object();
        for (size_t i = 0; i < columns.size() && i < r.size(); ++i) {
            row[columns[i]] = r[i];
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::vector<json> SankhyaGatewayReader::read() {
    if (!authenticated()) authenticate();

    json request = {
        {"serviceName", QUERY_SERVICE},
        {"requestBody", {{"sql", sql_}}}
    };
    std::string url = cfg_.base_url + "/gateway/v1/mge/service.sbr?serviceName=" +
                      QUERY_SERVICE + "&outputType=json";

    HttpResponse resp;
    try {
        resp = http_->post(url, request.dump(),
                           {"Content-Type: application/json",
                            "Accept: application/json",
                            "Authorization: Bearer " + bearer_});
    } catch (const HttpError& e) {
        throw SourceError(std::string("[SANKHYA] Query failed: ") + e.what());
    }

    json reply;
    try {
        reply = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throw SourceError(std::string("[SANKHYA] Query reply parse failed: ") + e.what());
    }

    auto rows = parse_query_reply(reply);
    std::cout << "[SANKHYA] " << rows.size() << " rows read\n";
    return rows;
}
