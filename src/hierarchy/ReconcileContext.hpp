#pragma once
#include <string>
#include <unordered_map>

#include "hierarchy/HierarchyProfile.hpp"
#include "hierarchy/NodeLocator.hpp"
#include "hierarchy/RunReport.hpp"
#include "hierarchy/SchemaCapabilities.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

// Run-scoped state shared by pass A and pass B.
// Constructed once per run by HierarchyReconciler, discarded with the run.
struct ReconcileContext {
    ReconcileContext(ITargetStore& s, const HierarchyProfile& p, SchemaCapabilities c)
        : store(s), profile(p), caps(std::move(c)), locator(s, p, caps) {}

    ReconcileContext(const ReconcileContext&) = delete;
    ReconcileContext& operator=(const ReconcileContext&) = delete;

    ITargetStore& store;
    const HierarchyProfile& profile;
    const SchemaCapabilities caps;
    NodeLocator locator;

    RecordId anchor_id = 0;
    bool verbose = false;

    // external code -> target id. Filled by pass A, extended by pass B
    // lookups; entries are never removed within the run.
    std::unordered_map<std::string, RecordId> code_to_id;

    // target id -> target parent id, for every link known to hold in the
    // target during this run (pass A anchors, pass B links, looked-up
    // parents). Pass B walks it to refuse links that would close a cycle.
    std::unordered_map<RecordId, RecordId> parent_links;

    RunReport report;
};

} // namespace canopy
