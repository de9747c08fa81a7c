#pragma once
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

#include "hierarchy/HierarchyValidator.hpp"

namespace canopy {

// Aggregate outcome of one run. The only summary the engine produces.
struct RunReport {
    // pass A
    size_t created = 0;
    size_t updated = 0;
    size_t errors = 0;

    // pass B
    size_t parents_applied = 0;
    size_t orphans_in_run = 0;
    size_t parent_errors = 0;
    size_t roots = 0;
    size_t self_references_skipped = 0;
    size_t cycle_edges_skipped = 0;
    size_t unmaterialized_skipped = 0;   // node failed in pass A

    // source diagnostics
    ValidationReport validation;

    bool has_errors() const { return errors > 0 || parent_errors > 0; }

    // Nodes whose final parent link holds after the run: linked to their
    // parent in pass B, or roots left at the anchor by pass A.
    size_t links_settled() const { return parents_applied + roots; }

    // Operator table, one "label  count" line per counter.
    std::string summary(const std::string& title) const;

    nlohmann::json to_json() const;
};

} // namespace canopy
