#pragma once
#include <optional>
#include <string>
#include <vector>

#include "hierarchy/HierarchyProfile.hpp"
#include "hierarchy/SchemaCapabilities.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

// A target record as far as the hierarchy cares.
struct TargetRef {
    RecordId id = 0;
    std::optional<RecordId> parent_id;
};

// Looks target records up by external code and resolves the Default Anchor.
class NodeLocator {
public:
    NodeLocator(ITargetStore& store, const HierarchyProfile& profile, const SchemaCapabilities& caps);

    // First record carrying `code`; nullopt for empty or root codes.
    std::optional<TargetRef> find(const std::string& code) const;

    // Up to `limit` records carrying `code` (duplicate detection).
    std::vector<TargetRef> find_all(const std::string& code, int limit) const;

    // Record `id` of the profile model with its stored parent.
    std::optional<TargetRef> find_by_id(RecordId id) const;

    // Throws ReconcileError when the anchor does not exist.
    RecordId resolve_anchor() const;

private:
    TargetRef to_ref(const Record& r) const;

    ITargetStore& store_;
    const HierarchyProfile& profile_;
    const SchemaCapabilities& caps_;
};

} // namespace canopy
