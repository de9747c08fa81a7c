#include "hierarchy/HierarchyVerifier.hpp"
#include "hierarchy/NodeLocator.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

using namespace canopy;

std::string VerifyReport::summary(const std::string& title) const {
    std::ostringstream out;
    out << "============================================\n";
    out << "  " << title << "\n";
    out << "============================================\n";
    auto row = [&out](const char* label, size_t value) {
        out << "  " << std::left << std::setw(28) << label << std::right << std::setw(8) << value << "\n";
    };
    row("Checked", checked);
    row("Missing", missing);
    row("Duplicated", duplicated);
    row("Anchored", anchored);
    row("Linked", linked);
    row("Mislinked", mislinked);
    row("Cycles", cycles);
    out << "============================================\n";
    return out.str();
}

HierarchyVerifier::HierarchyVerifier(ITargetStore& store, const HierarchyProfile& profile,
                                     const SchemaCapabilities& caps, RecordId anchor_id)
    : store_(store), profile_(profile), caps_(caps), anchor_id_(anchor_id) {}

VerifyReport HierarchyVerifier::verify(const std::vector<Node>& nodes) const {
    NodeLocator locator(store_, profile_, caps_);
    VerifyReport r;

    std::unordered_map<std::string, TargetRef> by_code;
    std::unordered_map<RecordId, RecordId> parent_of;

    for (const auto& n : nodes) {
        if (n.external_code.empty() || by_code.count(n.external_code)) continue;
        ++r.checked;

        auto hits = locator.find_all(n.external_code, 2);
        if (hits.empty()) {
            ++r.missing;
            std::cout << "[VERIFY] missing " << n.external_code << "\n";
            continue;
        }
        if (hits.size() > 1) {
            ++r.duplicated;
            std::cout << "[VERIFY] duplicated " << n.external_code << "\n";
        }
        by_code[n.external_code] = hits.front();
        if (hits.front().parent_id) {
            parent_of[hits.front().id] = *hits.front().parent_id;
        }
    }

    std::unordered_set<std::string> seen;
    for (const auto& n : nodes) {
        auto it = by_code.find(n.external_code);
        if (it == by_code.end() || !seen.insert(n.external_code).second) continue;

        const TargetRef& ref = it->second;
        if (!ref.parent_id || *ref.parent_id == anchor_id_) {
            ++r.anchored;
            continue;
        }
        std::optional<RecordId> expected;
        if (!n.is_root()) {
            auto parent = by_code.find(n.parent_code);
            if (parent != by_code.end()) {
                expected = parent->second.id;
            } else if (auto outside = locator.find(n.parent_code)) {
                expected = outside->id;   // parent kept from an earlier batch
            }
        }
        if (expected && *expected == *ref.parent_id) {
            ++r.linked;
        } else {
            ++r.mislinked;
            std::cout << "[VERIFY] " << n.external_code << " is under record "
                      << *ref.parent_id << ", expected '" << n.parent_code << "'\n";
        }
    }

    // Cycles among the records read back
    std::unordered_set<RecordId> resolved;
    for (const auto& kv : parent_of) {
        if (resolved.count(kv.first)) continue;
        std::unordered_set<RecordId> trail;
        RecordId cur = kv.first;
        while (true) {
            if (resolved.count(cur)) break;
            if (trail.count(cur)) {
                ++r.cycles;
                break;
            }
            trail.insert(cur);
            auto up = parent_of.find(cur);
            if (up == parent_of.end()) break;
            cur = up->second;
        }
        resolved.insert(trail.begin(), trail.end());
    }

    std::cout << r.summary("Verify " + profile_.name);
    return r;
}
