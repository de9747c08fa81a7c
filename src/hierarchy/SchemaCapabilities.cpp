#include "hierarchy/SchemaCapabilities.hpp"
#include "hierarchy/ReconcileError.hpp"
#include <algorithm>
#include <iostream>

using json = nlohmann::json;

namespace canopy {

const char* to_string(KeyStrategy k) {
    switch (k) {
        case KeyStrategy::CustomField: return "custom-field";
        case KeyStrategy::NativeField: return "native-field";
        case KeyStrategy::LabelPrefix: return "label-prefix";
    }
    return "?";
}

KeyStrategy SchemaCapabilities::key_strategy() const {
    if (key_field) return KeyStrategy::CustomField;
    if (!native_key_field.empty()) return KeyStrategy::NativeField;
    return KeyStrategy::LabelPrefix;
}

json SchemaCapabilities::key_domain(const HierarchyProfile& profile, const std::string& code) const {
    switch (key_strategy()) {
        case KeyStrategy::CustomField:
            return json::array({json::array({*key_field, "=", code})});
        case KeyStrategy::NativeField:
            return json::array({json::array({native_key_field, "=", code})});
        case KeyStrategy::LabelPrefix:
            break;
    }
    return json::array({json::array({label_field, "=like", profile.label_prefix(code) + "%"})});
}

std::vector<std::string> SchemaCapabilities::immutable_fields() const {
    std::vector<std::string> out;
    if (key_field) out.push_back(*key_field);
    if (!native_key_field.empty()) out.push_back(native_key_field);
    return out;
}

std::optional<std::string> first_available_field(const json& fields,
                                                 const FieldCandidates& candidates) {
    if (!fields.is_object()) return std::nullopt;
    for (const auto& name : candidates.names) {
        auto it = fields.find(name);
        if (it == fields.end() || !it->is_object()) continue;
        std::string type = it->value("type", std::string());
        if (std::find(candidates.types.begin(), candidates.types.end(), type) != candidates.types.end()) {
            return name;
        }
    }
    return std::nullopt;
}

SchemaCapabilities probe_schema(ITargetStore& store, const HierarchyProfile& profile) {
    json fields = store.fields(profile.model);

    SchemaCapabilities caps;
    caps.key_field            = first_available_field(fields, profile.key_candidates);
    caps.parent_staging_field = first_available_field(fields, profile.parent_staging_candidates);
    caps.level_field          = first_available_field(fields, profile.level_candidates);
    caps.native_key_field     = profile.native_key_field;
    caps.label_field          = profile.label_field;

    if (!fields.contains(profile.parent_field)) {
        throw ReconcileError("[SYNC] " + profile.model + " has no parent field '" +
                             profile.parent_field + "'");
    }
    if (!caps.native_key_field.empty() && !fields.contains(caps.native_key_field)) {
        throw ReconcileError("[SYNC] " + profile.model + " has no key field '" +
                             caps.native_key_field + "'");
    }
    if (caps.key_strategy() == KeyStrategy::LabelPrefix &&
        profile.label_style != LabelStyle::CodePrefixed) {
        throw ReconcileError("[SYNC] " + profile.model +
                             ": no key field and labels do not carry the code");
    }

    std::cout << "[SYNC] " << profile.model << " key=" << to_string(caps.key_strategy())
              << " (" << caps.key_field.value_or(caps.native_key_field.empty()
                                                     ? caps.label_field
                                                     : caps.native_key_field) << ")"
              << " parent_staging=" << caps.parent_staging_field.value_or("-")
              << " level=" << caps.level_field.value_or("-") << "\n";
    return caps;
}

} // namespace canopy
