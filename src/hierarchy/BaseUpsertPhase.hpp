#pragma once
#include <vector>
#include <nlohmann/json.hpp>

#include "hierarchy/Node.hpp"
#include "hierarchy/ReconcileContext.hpp"

namespace canopy {

enum class UpsertAction { Created, Updated };

// Pass A: create or update every node anchored at the Default Anchor,
// filling ctx.code_to_id. Never resolves a real parent.
class BaseUpsertPhase {
public:
    explicit BaseUpsertPhase(ReconcileContext& ctx);

    // Per-node failures are counted in ctx.report and logged; never thrown.
    void run(std::vector<Node>& ordered);

    // One node. Throws on empty code or adapter failure.
    UpsertAction upsert(Node& node);

    // Self-describing values plus the anchor as parent.
    nlohmann::json build_values(const Node& node) const;

private:
    ReconcileContext& ctx_;
};

} // namespace canopy
