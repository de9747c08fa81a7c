#include "hierarchy/HierarchyReconciler.hpp"
#include "hierarchy/BaseUpsertPhase.hpp"
#include "hierarchy/Leveling.hpp"
#include "hierarchy/NodeMapper.hpp"
#include "hierarchy/ParentReconcilePhase.hpp"
#include "hierarchy/ReconcileContext.hpp"
#include "hierarchy/ReconcileError.hpp"
#include <iostream>

using namespace canopy;

HierarchyReconciler::HierarchyReconciler(ITargetStore& store, HierarchyProfile profile, ReconcileOptions opts)
    : store_(store), profile_(std::move(profile)), opts_(opts) {}

ValidationReport HierarchyReconciler::validate(const std::vector<Node>& nodes) const {
    return HierarchyValidator().validate(nodes);
}

RunReport HierarchyReconciler::run_rows(const std::vector<nlohmann::json>& rows) {
    return run(to_nodes(rows, profile_.mapping));
}

RunReport HierarchyReconciler::run(std::vector<Node> nodes) {
    std::cout << "[SYNC] " << profile_.name << ": " << nodes.size() << " source nodes\n";

    // --- Source diagnostics (advisory) ---
    ValidationReport validation = validate(nodes);
    if (!validation.clean()) {
        std::cout << "[VALIDATE] " << profile_.name
                  << ": self_ref=" << validation.self_references
                  << " orphans=" << validation.orphans
                  << " cycles=" << validation.cycles
                  << " duplicates=" << validation.duplicate_codes
                  << " empty_codes=" << validation.empty_codes << "\n";
    }

    // --- Run preconditions: schema and anchor ---
    SchemaCapabilities caps;
    try {
        caps = probe_schema(store_, profile_);
    } catch (const StoreError& e) {
        throw ReconcileError(std::string("[SYNC] Schema probe failed: ") + e.what());
    }
    if (opts_.require_key_field && caps.key_strategy() == KeyStrategy::LabelPrefix) {
        throw ReconcileError("[SYNC] " + profile_.model +
                             " has no external code field and require_key_field is set");
    }
    caps_ = caps;

    ReconcileContext ctx(store_, profile_, caps);
    ctx.verbose = opts_.verbose;
    ctx.report.validation = validation;

    try {
        if (opts_.anchor_id) {
            if (!ctx.locator.find_by_id(*opts_.anchor_id)) {
                throw ReconcileError("[SYNC] Default anchor not found: no " + profile_.model +
                                     " with id " + std::to_string(*opts_.anchor_id));
            }
            ctx.anchor_id = *opts_.anchor_id;
        } else {
            ctx.anchor_id = ctx.locator.resolve_anchor();
        }
    } catch (const StoreError& e) {
        throw ReconcileError(std::string("[SYNC] Default anchor lookup failed: ") + e.what());
    }
    anchor_id_ = ctx.anchor_id;

    // --- Two passes over one ordering ---
    std::vector<Node> ordered = level_order(std::move(nodes));

    BaseUpsertPhase(ctx).run(ordered);
    ParentReconcilePhase(ctx).run(ordered);

    std::cout << ctx.report.summary("Summary " + profile_.name);
    return ctx.report;
}
