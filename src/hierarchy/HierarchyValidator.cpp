#include "hierarchy/HierarchyValidator.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>

using namespace canopy;

ValidationReport HierarchyValidator::validate(const std::vector<Node>& nodes) const {
    ValidationReport r;

    std::unordered_set<std::string> codes;
    for (const auto& n : nodes) {
        if (!n.external_code.empty()) codes.insert(n.external_code);
    }

    // code -> parent, walked in first-seen order
    std::unordered_map<std::string, std::string> parent_of;
    std::vector<std::string> order;

    for (const auto& n : nodes) {
        if (n.external_code.empty()) {
            ++r.empty_codes;
            continue;
        }
        if (parent_of.count(n.external_code)) {
            ++r.duplicate_codes;
        } else {
            order.push_back(n.external_code);
        }
        parent_of[n.external_code] = n.parent_code;

        if (n.is_self_reference()) {
            ++r.self_references;
        } else if (!n.is_root() && !codes.count(n.parent_code)) {
            ++r.orphans;
        }
    }

    std::unordered_set<std::string> resolved;
    for (const auto& start : order) {
        if (resolved.count(start)) continue;

        std::unordered_set<std::string> trail;
        std::string cur = start;
        while (!cur.empty()) {
            auto it = parent_of.find(cur);
            if (it == parent_of.end()) break;          // walked off the batch
            if (resolved.count(cur)) break;            // joined an earlier walk
            if (trail.count(cur)) {
                ++r.cycles;
                break;
            }
            trail.insert(cur);

            const std::string& next = it->second;
            if (next.empty() || next == NO_PARENT || next == cur) break;
            cur = next;
        }
        resolved.insert(trail.begin(), trail.end());
    }

    return r;
}
