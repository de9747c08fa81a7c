#include "hierarchy/HierarchyProfile.hpp"

using namespace canopy;
using json = nlohmann::json;

static FieldCandidates key_field_candidates() {
    return {{"x_sankhya_id", "x_codigo_sankhya", "x_studio_sankhya_id"},
            {"char", "integer"}};
}

static FieldCandidates parent_staging_candidates() {
    return {{"x_parent_sankhya_id", "x_codigo_pai_sankhya", "x_studio_parent_sankhya_id"},
            {"char", "integer"}};
}

static FieldCandidates level_field_candidates() {
    return {{"x_grau", "x_studio_grau"},
            {"integer", "float", "char"}};
}

std::string HierarchyProfile::label(const std::string& code, const std::string& display_name) const {
    std::string shown = display_name;
    if (shown.empty()) {
        shown = default_name;
        auto pos = shown.find("{code}");
        if (pos != std::string::npos) shown.replace(pos, 6, code);
    }
    if (label_style == LabelStyle::CodePrefixed) {
        return label_prefix(code) + " " + shown;
    }
    return shown;
}

std::string HierarchyProfile::label_prefix(const std::string& code) const {
    if (label_style != LabelStyle::CodePrefixed) return "";
    return "[" + code + "]";
}

HierarchyProfile canopy::category_profile() {
    HierarchyProfile p;
    p.name = "categories";
    p.model = "product.category";
    p.parent_field = "parent_id";
    p.label_style = LabelStyle::CodePrefixed;
    p.default_name = "Grupo {code}";
    p.key_candidates = key_field_candidates();
    p.parent_staging_candidates = parent_staging_candidates();
    p.level_candidates = level_field_candidates();
    p.mapping = {"CODGRUPOPROD", "CODGRUPAI", "DESCRGRUPOPROD", "GRAU"};
    p.anchor.model = "product.category";
    p.anchor.domain = json::array({json::array({"name", "=", "All"}),
                                   json::array({"parent_id", "=", false})});
    p.anchor.field = "id";
    return p;
}

HierarchyProfile canopy::location_profile() {
    HierarchyProfile p;
    p.name = "locations";
    p.model = "stock.location";
    p.parent_field = "location_id";
    p.label_style = LabelStyle::PlainName;
    p.default_name = "Local Sankhya";
    p.native_key_field = "barcode";
    p.static_values = {{"usage", "internal"}, {"active", true}};
    p.key_candidates = key_field_candidates();
    p.parent_staging_candidates = parent_staging_candidates();
    p.level_candidates = level_field_candidates();
    p.mapping = {"CODLOCAL", "CODLOCALPAI", "DESCRLOCAL", "GRAU"};
    p.anchor.model = "stock.warehouse";
    p.anchor.domain = json::array();
    p.anchor.field = "lot_stock_id";
    return p;
}

std::optional<HierarchyProfile> canopy::find_profile(const std::string& name) {
    if (name == "categories") return category_profile();
    if (name == "locations")  return location_profile();
    return std::nullopt;
}
