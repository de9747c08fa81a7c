#include "store/OdooJsonRpcStore.hpp"
#include <iostream>

using namespace canopy;
using json = nlohmann::json;

static std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

OdooJsonRpcStore::OdooJsonRpcStore(const OdooConfig& cfg)
    : cfg_(cfg),
      endpoint_(strip_trailing_slash(cfg.url) + "/jsonrpc"),
      http_(std::make_unique<HttpClient>(cfg.timeout_seconds, cfg.max_retries)) {}

json OdooJsonRpcStore::build_call(const std::string& service,
                                  const std::string& method,
                                  const json& args,
                                  int64_t request_id) {
    return {
        {"jsonrpc", "2.0"},
        {"method", "call"},
        {"params", {{"service", service}, {"method", method}, {"args", args}}},
        {"id", request_id}
    };
}

json OdooJsonRpcStore::unwrap_reply(const json& reply) {
    if (!reply.is_object()) {
        throw StoreError("[ODOO] Malformed JSON-RPC reply");
    }
    if (reply.contains("error") && !reply["error"].is_null()) {
        const json& err = reply["error"];
        std::string msg = err.value("message", std::string("JSON-RPC error"));
        if (err.contains("data") && err["data"].is_object()) {
            msg = err["data"].value("message", msg);
        }
        throw StoreError("[ODOO] " + msg);
    }
    if (!reply.contains("result")) {
        throw StoreError("[ODOO] JSON-RPC reply without result");
    }
    return reply["result"];
}

json OdooJsonRpcStore::call(const std::string& service,
                            const std::string& method,
                            const json& args) {
    json request = build_call(service, method, args, next_id_++);

    HttpResponse resp;
    try {
        resp = http_->post(endpoint_, request.dump(),
                           {"Content-Type: application/json", "Accept: application/json"});
    } catch (const HttpError& e) {
        throw StoreError(e.what());
    }

    json reply;
    try {
        reply = json::parse(resp.body);
    } catch (const json::parse_error& e) {
        throw StoreError(std::string("[ODOO] Reply parse failed: ") + e.what());
    }
    return unwrap_reply(reply);
}

void OdooJsonRpcStore::connect() {
    json result = call("common", "login", json::array({cfg_.db, cfg_.username, cfg_.password}));
    if (!result.is_number_integer() || result.get<int64_t>() <= 0) {
        throw StoreError("[ODOO] Login rejected for " + cfg_.username + "@" + cfg_.db);
    }
    uid_ = result.get<int64_t>();
    std::cout << "[ODOO] Connected to " << cfg_.url << " db=" << cfg_.db
              << " uid=" << uid_ << "\n";
}

json OdooJsonRpcStore::execute_kw(const std::string& model,
                                  const std::string& method,
                                  const json& args,
                                  const json& kwargs) {
    if (!connected()) {
        throw StoreError("[ODOO] Not connected. Call connect() first.");
    }
    return call("object", "execute_kw",
                json::array({cfg_.db, uid_, cfg_.password, model, method, args, kwargs}));
}

std::vector<Record> OdooJsonRpcStore::search(const std::string& model,
                                             const json& domain,
                                             const std::vector<std::string>& fields,
                                             int limit) {
    json kwargs = json::object();
    if (!fields.empty()) kwargs["fields"] = fields;
    if (limit > 0) kwargs["limit"] = limit;

    json result = execute_kw(model, "search_read", json::array({domain}), kwargs);
    if (!result.is_array()) {
        throw StoreError("[ODOO] search_read on " + model + " did not return a list");
    }
    return result.get<std::vector<Record>>();
}

RecordId OdooJsonRpcStore::create(const std::string& model, const json& values) {
    json result = execute_kw(model, "create", json::array({values}));
    // Odoo 17 accepts vals_list and may answer [id]
    if (result.is_array() && result.size() == 1) result = result[0];
    if (!result.is_number_integer()) {
        throw StoreError("[ODOO] create on " + model + " did not return an id");
    }
    return result.get<RecordId>();
}

bool OdooJsonRpcStore::update(const std::string& model, RecordId id, const json& values) {
    json result = execute_kw(model, "write", json::array({json::array({id}), values}));
    return result.is_boolean() && result.get<bool>();
}

json OdooJsonRpcStore::fields(const std::string& model) {
    json result = execute_kw(model, "fields_get", json::array(),
                             {{"attributes", json::array({"type", "relation"})}});
    if (!result.is_object()) {
        throw StoreError("[ODOO] fields_get on " + model + " did not return a mapping");
    }
    return result;
}
