#include "hierarchy/BaseUpsertPhase.hpp"
#include <iostream>
#include <stdexcept>

using namespace canopy;
using json = nlohmann::json;

BaseUpsertPhase::BaseUpsertPhase(ReconcileContext& ctx)
    : ctx_(ctx) {}

json BaseUpsertPhase::build_values(const Node& node) const {
    const HierarchyProfile& p = ctx_.profile;
    const SchemaCapabilities& caps = ctx_.caps;

    json vals = p.static_values.is_object() ? p.static_values : json::object();
    vals[p.label_field] = p.label(node.external_code, node.display_name);

    if (!caps.native_key_field.empty()) {
        vals[caps.native_key_field] = node.external_code;
    }
    if (caps.key_field) {
        vals[*caps.key_field] = node.external_code;
    }
    if (caps.parent_staging_field) {
        vals[*caps.parent_staging_field] = node.parent_code;
    }
    if (caps.level_field) {
        vals[*caps.level_field] = node.level.value_or(0);
    }

    vals[p.parent_field] = ctx_.anchor_id;
    return vals;
}

UpsertAction BaseUpsertPhase::upsert(Node& node) {
    if (node.external_code.empty()) {
        throw std::invalid_argument("empty external code");
    }

    json vals = build_values(node);
    auto existing = ctx_.locator.find(node.external_code);

    UpsertAction action;
    RecordId id;
    if (existing) {
        id = existing->id;
        for (const auto& f : ctx_.caps.immutable_fields()) {
            vals.erase(f);
        }
        if (!ctx_.store.update(ctx_.profile.model, id, vals)) {
            throw std::runtime_error("update of record " + std::to_string(id) + " was refused");
        }
        action = UpsertAction::Updated;
    } else {
        id = ctx_.store.create(ctx_.profile.model, vals);
        action = UpsertAction::Created;
    }

    node.target_id = id;
    ctx_.code_to_id[node.external_code] = id;
    ctx_.parent_links[id] = ctx_.anchor_id;
    return action;
}

void BaseUpsertPhase::run(std::vector<Node>& ordered) {
    std::cout << "[PASS-A] Base upsert of " << ordered.size() << " nodes into "
              << ctx_.profile.model << " (anchor=" << ctx_.anchor_id << ")\n";

    RunReport& r = ctx_.report;
    for (auto& node : ordered) {
        try {
            UpsertAction action = upsert(node);
            if (action == UpsertAction::Created) {
                ++r.created;
            } else {
                ++r.updated;
            }
            if (ctx_.verbose) {
                std::cout << "[PASS-A] " << (action == UpsertAction::Created ? "created " : "updated ")
                          << node.external_code << " -> " << *node.target_id << "\n";
            }
        } catch (const std::exception& e) {
            ++r.errors;
            std::cerr << "[PASS-A] Error on node '" << node.external_code << "': " << e.what() << "\n";
        }
    }

    std::cout << "[PASS-A] created=" << r.created << " updated=" << r.updated
              << " errors=" << r.errors << "\n";
}
