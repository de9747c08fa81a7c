#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "hierarchy/HierarchyProfile.hpp"
#include "hierarchy/Node.hpp"
#include "hierarchy/SchemaCapabilities.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

struct VerifyReport {
    size_t checked = 0;
    size_t missing = 0;      // no record for the code
    size_t duplicated = 0;   // more than one record for the code
    size_t anchored = 0;     // still under the Default Anchor
    size_t linked = 0;       // under the record of its parent code
    size_t mislinked = 0;    // under some other record
    size_t cycles = 0;       // parent chains that return to their origin

    bool ok() const { return missing == 0 && duplicated == 0 && mislinked == 0 && cycles == 0; }

    std::string summary(const std::string& title) const;
};

// Reads the target back after a run and checks it against the batch.
class HierarchyVerifier {
public:
    HierarchyVerifier(ITargetStore& store, const HierarchyProfile& profile,
                      const SchemaCapabilities& caps, RecordId anchor_id);

    VerifyReport verify(const std::vector<Node>& nodes) const;

private:
    ITargetStore& store_;
    const HierarchyProfile& profile_;
    const SchemaCapabilities& caps_;
    RecordId anchor_id_;
};

} // namespace canopy
