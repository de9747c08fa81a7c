#pragma once
#include <functional>
#include <map>
#include <string>
#include <unordered_map>

#include "store/TargetStore.hpp"

namespace canopy {

// In-process target store. Behaves like the Odoo models the sync writes to:
// typed fields, many2one referential integrity checked at write time, and
// recursion rejected on a model's hierarchical parent field.
class MemoryStore : public ITargetStore {
public:
    // Called before every create/update; throwing from it fails the write.
    using WriteHook = std::function<void(const std::string& op,
                                         const std::string& model,
                                         const nlohmann::json& values)>;

    struct Counters {
        int search = 0;
        int create = 0;
        int update = 0;
        int fields = 0;
    };

    // field_types: {"name": {"type": "char"}, "parent_id": {"type": "many2one",
    // "relation": "product.category"}, ...}. parent_field may be empty.
    void define_model(const std::string& model,
                      const nlohmann::json& field_types,
                      const std::string& parent_field = "");

    // Inserts a record without hooks or counters (fixtures, anchors).
    RecordId seed(const std::string& model, const nlohmann::json& values);

    std::vector<Record> search(const std::string& model,
                               const nlohmann::json& domain,
                               const std::vector<std::string>& fields,
                               int limit) override;

    RecordId create(const std::string& model, const nlohmann::json& values) override;

    bool update(const std::string& model, RecordId id, const nlohmann::json& values) override;

    nlohmann::json fields(const std::string& model) override;

    // Raw stored record (many2one kept as a bare id or null).
    const Record& get(const std::string& model, RecordId id) const;
    bool exists(const std::string& model, RecordId id) const;
    size_t count(const std::string& model) const;
    std::vector<RecordId> ids(const std::string& model) const;

    void set_write_hook(WriteHook hook) { hook_ = std::move(hook); }
    const Counters& counters() const { return counters_; }
    void reset_counters() { counters_ = Counters{}; }

    // SQL LIKE with % and _ wildcards.
    static bool like_match(const std::string& text, const std::string& pattern, bool icase);

private:
    struct Model {
        nlohmann::json field_types = nlohmann::json::object();
        std::string parent_field;
        std::map<RecordId, Record> rows;
    };

    Model& model_ref(const std::string& model);
    const Model& model_ref(const std::string& model) const;

    nlohmann::json normalize(const std::string& model, const Model& m,
                             const nlohmann::json& values) const;
    void check_recursion(const Model& m, RecordId id, const nlohmann::json& values) const;
    bool matches(const Model& m, const Record& row, const nlohmann::json& domain) const;
    Record project(const Model& m, const Record& row, const std::vector<std::string>& fields) const;

    std::unordered_map<std::string, Model> models_;
    RecordId next_id_{1};
    WriteHook hook_;
    Counters counters_;
};

} // namespace canopy
