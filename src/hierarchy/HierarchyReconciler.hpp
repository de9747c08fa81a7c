#pragma once
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

#include "hierarchy/HierarchyProfile.hpp"
#include "hierarchy/HierarchyValidator.hpp"
#include "hierarchy/Node.hpp"
#include "hierarchy/RunReport.hpp"
#include "hierarchy/SchemaCapabilities.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

struct ReconcileOptions {
    // Refuse to run when the only way to identify a node is its label.
    bool require_key_field = false;

    // Use this record as the Default Anchor instead of the profile query.
    // It must exist in the profile model; run() checks it once.
    std::optional<RecordId> anchor_id;

    bool verbose = false;
};

// Two-pass materialization of one hierarchy batch into the target:
//   validate -> level -> pass A (anchor everything) -> pass B (link parents)
//
// Single-threaded; every target write is independent and immediately
// committed. An interrupted run leaves valid records anchored at the
// Default Anchor and is safe to repeat.
class HierarchyReconciler {
public:
    HierarchyReconciler(ITargetStore& store, HierarchyProfile profile, ReconcileOptions opts = {});

    // Throws ReconcileError when the schema or the Default Anchor makes the
    // run impossible; per-node failures only show up in the report.
    RunReport run(std::vector<Node> nodes);

    RunReport run_rows(const std::vector<nlohmann::json>& rows);

    // Source diagnostics alone, no target access.
    ValidationReport validate(const std::vector<Node>& nodes) const;

    const HierarchyProfile& profile() const { return profile_; }

    // Capabilities and anchor of the last run (set once run() got past the
    // probe).
    const std::optional<SchemaCapabilities>& capabilities() const { return caps_; }
    RecordId anchor_id() const { return anchor_id_; }

private:
    ITargetStore& store_;
    HierarchyProfile profile_;
    ReconcileOptions opts_;

    std::optional<SchemaCapabilities> caps_;
    RecordId anchor_id_{0};
};

} // namespace canopy
