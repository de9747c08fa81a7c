#pragma once
#include <optional>
#include <string>
#include <vector>

#include "hierarchy/Node.hpp"
#include "hierarchy/ReconcileContext.hpp"

namespace canopy {

enum class LinkOutcome {
    Applied,
    Root,               // no parent declared
    SelfReference,
    Unmaterialized,     // node has no target record (failed in pass A)
    Orphan,             // parent not found in the run map nor in the target
    CycleEdge           // link would close a parent cycle
};

// Pass B: replace each node's anchor with its real parent, one update per
// node. Runs strictly after pass A over the same ordering.
class ParentReconcilePhase {
public:
    explicit ParentReconcilePhase(ReconcileContext& ctx);

    // Per-node failures are counted in ctx.report and logged; never thrown.
    void run(const std::vector<Node>& ordered);

    // One node. Throws on adapter failure.
    LinkOutcome link(const Node& node);

    // Parent's target id from the run map, else from the target (a hit is
    // remembered for the rest of the run).
    std::optional<RecordId> resolve_parent(const std::string& parent_code);

    // Stored parent chain above a looked-up parent, up to the first record
    // whose link is already known.
    void load_ancestors(RecordId id);

    // True when parent_id already descends from child_id through the links
    // known in this run.
    bool closes_cycle(RecordId child_id, RecordId parent_id) const;

private:
    ReconcileContext& ctx_;
};

} // namespace canopy
