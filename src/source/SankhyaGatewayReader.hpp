#pragma once
#include <memory>
#include <string>

#include "config/SyncConfig.hpp"
#include "net/HttpClient.hpp"
#include "source/SourceReader.hpp"

namespace canopy {

// Reads one SQL result set from Sankhya through the API gateway:
//   POST <base>/authenticate                       (OAuth client credentials)
//   POST <base>/gateway/v1/mge/service.sbr         (DbExplorerSP.executeQuery)
class SankhyaGatewayReader : public ISourceReader {
public:
    SankhyaGatewayReader(const SankhyaConfig& cfg, std::string sql);

    void authenticate();
    bool authenticated() const { return !bearer_.empty(); }

    std::vector<nlohmann::json> read() override;

    // Rows of a DbExplorerSP.executeQuery reply, rebuilt as objects from
    // responseBody.fieldsMetadata + responseBody.rows.
    static std::vector<nlohmann::json> parse_query_reply(const nlohmann::json& reply);

    // Reads and trims a .sql file. Throws SourceError when it is missing.
    static std::string load_sql(const std::string& path);

private:
    SankhyaConfig cfg_;
    std::string sql_;
    std::string bearer_;
    std::unique_ptr<HttpClient> http_;
};

} // namespace canopy
