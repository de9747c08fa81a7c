#pragma once
#include <memory>
#include <string>

#include "config/SyncConfig.hpp"
#include "net/HttpClient.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

// Odoo external API over JSON-RPC (POST <url>/jsonrpc).
//   common.login       -> uid
//   object.execute_kw  -> search_read / create / write / fields_get
class OdooJsonRpcStore : public ITargetStore {
public:
    explicit OdooJsonRpcStore(const OdooConfig& cfg);

    // Authenticates and caches the uid. Throws StoreError on bad credentials.
    void connect();
    bool connected() const { return uid_ > 0; }
    int64_t uid() const { return uid_; }

    std::vector<Record> search(const std::string& model,
                               const nlohmann::json& domain,
                               const std::vector<std::string>& fields,
                               int limit) override;

    RecordId create(const std::string& model, const nlohmann::json& values) override;

    bool update(const std::string& model, RecordId id, const nlohmann::json& values) override;

    nlohmann::json fields(const std::string& model) override;

    nlohmann::json execute_kw(const std::string& model,
                              const std::string& method,
                              const nlohmann::json& args,
                              const nlohmann::json& kwargs = nlohmann::json::object());

    // JSON-RPC 2.0 envelope for service.method(args).
    static nlohmann::json build_call(const std::string& service,
                                     const std::string& method,
                                     const nlohmann::json& args,
                                     int64_t request_id);

    // "result" of a reply; throws StoreError carrying the server message
    // when the reply holds "error".
    static nlohmann::json unwrap_reply(const nlohmann::json& reply);

private:
    nlohmann::json call(const std::string& service,
                        const std::string& method,
                        const nlohmann::json& args);

    OdooConfig cfg_;
    std::string endpoint_;
    std::unique_ptr<HttpClient> http_;
    int64_t uid_{0};
    int64_t next_id_{1};
};

} // namespace canopy
