#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canopy {

using RecordId = int64_t;
using Record   = nlohmann::json;   // one target record: field name -> value

// Remote validation failure, transport failure or malformed reply.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

// Target system of record. Every call is one independent, immediately
// committed operation: no batching, no transactions, no server-side upsert.
//
// Domains follow the Odoo convention: a JSON array of [field, op, value]
// triples, all of which must hold.
class ITargetStore {
public:
    virtual ~ITargetStore() = default;

    virtual std::vector<Record> search(const std::string& model,
                                       const nlohmann::json& domain,
                                       const std::vector<std::string>& fields,
                                       int limit) = 0;

    virtual RecordId create(const std::string& model, const nlohmann::json& values) = 0;

    virtual bool update(const std::string& model, RecordId id, const nlohmann::json& values) = 0;

    // Field metadata: {"field": {"type": "char", ...}, ...}
    virtual nlohmann::json fields(const std::string& model) = 0;
};

// Id carried by a many2one value. Accepts [id, "display"], a bare id, or
// false/null (no value).
inline std::optional<RecordId> many2one_id(const nlohmann::json& v) {
    if (v.is_array() && !v.empty() && v[0].is_number_integer()) {
        return v[0].get<RecordId>();
    }
    if (v.is_number_integer()) {
        return v.get<RecordId>();
    }
    return std::nullopt;
}

} // namespace canopy
