#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "hierarchy/HierarchyProfile.hpp"
#include "store/TargetStore.hpp"

namespace canopy {

enum class KeyStrategy {
    CustomField,    // installation-specific external code field
    NativeField,    // profile's built-in key field (stock.location.barcode)
    LabelPrefix     // "[code] ..." label match
};

const char* to_string(KeyStrategy k);

// What the target installation exposes, resolved once per run and shared
// by both passes.
struct SchemaCapabilities {
    std::optional<std::string> key_field;
    std::optional<std::string> parent_staging_field;
    std::optional<std::string> level_field;
    std::string native_key_field;
    std::string label_field = "name";

    KeyStrategy key_strategy() const;

    // Domain matching the record of `code` under the active strategy.
    nlohmann::json key_domain(const HierarchyProfile& profile, const std::string& code) const;

    // Fields naming the node that must not change on update.
    std::vector<std::string> immutable_fields() const;
};

// First candidate present in `fields` (fields_get output) with an accepted
// type.
std::optional<std::string> first_available_field(const nlohmann::json& fields,
                                                 const FieldCandidates& candidates);

// fields_get on the profile model, then candidate selection.
SchemaCapabilities probe_schema(ITargetStore& store, const HierarchyProfile& profile);

} // namespace canopy
