#pragma once
#include <cstddef>
#include <vector>

#include "hierarchy/Node.hpp"

namespace canopy {

struct ValidationReport {
    size_t self_references = 0;
    size_t orphans = 0;
    size_t cycles = 0;
    size_t duplicate_codes = 0;   // extra occurrences of an already seen code
    size_t empty_codes = 0;

    bool clean() const {
        return self_references == 0 && orphans == 0 && cycles == 0 &&
               duplicate_codes == 0 && empty_codes == 0;
    }
};

// Diagnoses the source batch before any write. Never mutates the nodes,
// never touches the target, never blocks the run.
//
// Cycle search walks parent pointers from every code not yet resolved,
// keeping the trail of the current walk. Meeting the trail again is one
// cycle; meeting a code resolved by an earlier walk ends the walk. Every
// code of a finished trail is resolved, so each code is walked once.
class HierarchyValidator {
public:
    ValidationReport validate(const std::vector<Node>& nodes) const;
};

} // namespace canopy
