#include "hierarchy/NodeLocator.hpp"
#include "hierarchy/Node.hpp"
#include "hierarchy/ReconcileError.hpp"

using namespace canopy;
using json = nlohmann::json;

NodeLocator::NodeLocator(ITargetStore& store, const HierarchyProfile& profile, const SchemaCapabilities& caps)
    : store_(store), profile_(profile), caps_(caps) {}

TargetRef NodeLocator::to_ref(const Record& r) const {
    TargetRef ref;
    ref.id = r.at("id").get<RecordId>();
    ref.parent_id = many2one_id(r.value(profile_.parent_field, json()));
    return ref;
}

std::vector<TargetRef> NodeLocator::find_all(const std::string& code, int limit) const {
    std::vector<TargetRef> out;
    if (code.empty() || code == NO_PARENT) return out;

    auto rows = store_.search(profile_.model, caps_.key_domain(profile_, code),
                              {"id", profile_.parent_field}, limit);
    for (const auto& r : rows) {
        out.push_back(to_ref(r));
    }
    return out;
}

std::optional<TargetRef> NodeLocator::find(const std::string& code) const {
    auto hits = find_all(code, 1);
    if (hits.empty()) return std::nullopt;
    return hits.front();
}

std::optional<TargetRef> NodeLocator::find_by_id(RecordId id) const {
    auto rows = store_.search(profile_.model, json::array({json::array({"id", "=", id})}),
                              {"id", profile_.parent_field}, 1);
    if (rows.empty()) return std::nullopt;
    return to_ref(rows.front());
}

RecordId NodeLocator::resolve_anchor() const {
    const AnchorQuery& q = profile_.anchor;
    auto rows = store_.search(q.model, q.domain, {"id", q.field}, 1);
    if (rows.empty()) {
        throw ReconcileError("[SYNC] Default anchor not found: no " + q.model +
                             " matches " + q.domain.dump());
    }
    if (q.field == "id") {
        return rows.front().at("id").get<RecordId>();
    }
    auto id = many2one_id(rows.front().value(q.field, json()));
    if (!id) {
        throw ReconcileError("[SYNC] Default anchor not found: " + q.model + "." +
                             q.field + " is empty");
    }
    return *id;
}
