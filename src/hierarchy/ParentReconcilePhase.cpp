#include "hierarchy/ParentReconcilePhase.hpp"
#include <iostream>
#include <stdexcept>
#include <unordered_set>

using namespace canopy;
using json = nlohmann::json;

// Stored ancestors read per looked-up parent; deeper chains are left to the
// target's own recursion check.
static constexpr int MAX_ANCESTOR_HOPS = 64;

ParentReconcilePhase::ParentReconcilePhase(ReconcileContext& ctx)
    : ctx_(ctx) {}

std::optional<RecordId> ParentReconcilePhase::resolve_parent(const std::string& parent_code) {
    auto it = ctx_.code_to_id.find(parent_code);
    if (it != ctx_.code_to_id.end()) return it->second;

    auto found = ctx_.locator.find(parent_code);
    if (!found) return std::nullopt;

    ctx_.code_to_id[parent_code] = found->id;
    if (found->parent_id && !ctx_.parent_links.count(found->id)) {
        ctx_.parent_links[found->id] = *found->parent_id;
        load_ancestors(*found->parent_id);
    }
    return found->id;
}

void ParentReconcilePhase::load_ancestors(RecordId id) {
    RecordId cur = id;
    for (int hops = 0; hops < MAX_ANCESTOR_HOPS; ++hops) {
        if (cur == ctx_.anchor_id || ctx_.parent_links.count(cur)) return;
        auto ref = ctx_.locator.find_by_id(cur);
        if (!ref || !ref->parent_id) return;
        ctx_.parent_links[cur] = *ref->parent_id;
        cur = *ref->parent_id;
    }
}

bool ParentReconcilePhase::closes_cycle(RecordId child_id, RecordId parent_id) const {
    std::unordered_set<RecordId> seen;
    RecordId cur = parent_id;
    while (true) {
        if (cur == child_id) return true;
        if (!seen.insert(cur).second) return false;
        auto it = ctx_.parent_links.find(cur);
        if (it == ctx_.parent_links.end()) return false;
        cur = it->second;
    }
}

LinkOutcome ParentReconcilePhase::link(const Node& node) {
    // no record, no link: a failed root is not a settled one
    if (!node.target_id) return LinkOutcome::Unmaterialized;
    if (node.is_root()) return LinkOutcome::Root;
    if (node.is_self_reference()) return LinkOutcome::SelfReference;

    auto parent_id = resolve_parent(node.parent_code);
    if (!parent_id) return LinkOutcome::Orphan;

    const RecordId child_id = *node.target_id;
    if (closes_cycle(child_id, *parent_id)) return LinkOutcome::CycleEdge;

    json vals = {{ctx_.profile.parent_field, *parent_id}};
    if (!ctx_.store.update(ctx_.profile.model, child_id, vals)) {
        throw std::runtime_error("parent update of record " + std::to_string(child_id) + " was refused");
    }
    ctx_.parent_links[child_id] = *parent_id;
    return LinkOutcome::Applied;
}

void ParentReconcilePhase::run(const std::vector<Node>& ordered) {
    std::cout << "[PASS-B] Reconciling " << ctx_.profile.parent_field << " for "
              << ordered.size() << " nodes\n";

    RunReport& r = ctx_.report;
    for (const auto& node : ordered) {
        try {
            switch (link(node)) {
                case LinkOutcome::Applied:
                    ++r.parents_applied;
                    if (ctx_.verbose) {
                        std::cout << "[PASS-B] " << node.external_code << " -> " << node.parent_code << "\n";
                    }
                    break;
                case LinkOutcome::Root:
                    ++r.roots;
                    break;
                case LinkOutcome::SelfReference:
                    ++r.self_references_skipped;
                    std::cout << "[PASS-B] " << node.external_code
                              << " references itself; left at the anchor\n";
                    break;
                case LinkOutcome::Unmaterialized:
                    ++r.unmaterialized_skipped;
                    break;
                case LinkOutcome::Orphan:
                    ++r.orphans_in_run;
                    std::cout << "[PASS-B] " << node.external_code << ": parent '"
                              << node.parent_code << "' not found; left at the anchor\n";
                    break;
                case LinkOutcome::CycleEdge:
                    ++r.cycle_edges_skipped;
                    std::cout << "[PASS-B] " << node.external_code << " -> " << node.parent_code
                              << " would close a cycle; left at the anchor\n";
                    break;
            }
        } catch (const std::exception& e) {
            ++r.parent_errors;
            std::cerr << "[PASS-B] Error linking '" << node.external_code << "' to '"
                      << node.parent_code << "': " << e.what() << "\n";
        }
    }

    std::cout << "[PASS-B] applied=" << r.parents_applied << " orphans=" << r.orphans_in_run
              << " cycle_edges=" << r.cycle_edges_skipped << " errors=" << r.parent_errors << "\n";
}
