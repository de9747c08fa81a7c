#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canopy {

// Source column names for one hierarchy.
struct FieldMapping {
    std::string code;
    std::string parent;
    std::string name;
    std::string level;
};

// Where the Default Anchor lives in the target. When `field` is "id" the
// matching record itself is the anchor; otherwise `field` is a many2one on
// the matching record that points at it (stock.warehouse.lot_stock_id).
struct AnchorQuery {
    std::string model;
    nlohmann::json domain = nlohmann::json::array();
    std::string field = "id";
};

enum class LabelStyle {
    CodePrefixed,   // "[code] name": the label alone identifies the node
    PlainName
};

// Custom field candidates probed on the target model, first match wins.
struct FieldCandidates {
    std::vector<std::string> names;
    std::vector<std::string> types;
};

// Everything that distinguishes one synchronized hierarchy from another.
struct HierarchyProfile {
    std::string name;              // "categories", "locations"
    std::string model;             // target model
    std::string parent_field;      // hierarchical many2one on `model`
    std::string label_field = "name";
    LabelStyle label_style = LabelStyle::PlainName;
    std::string default_name;      // "{code}" is replaced by the node code
    std::string native_key_field;  // built-in field holding the code, may be empty
    nlohmann::json static_values = nlohmann::json::object();

    FieldCandidates key_candidates;
    FieldCandidates parent_staging_candidates;
    FieldCandidates level_candidates;

    FieldMapping mapping;
    AnchorQuery anchor;

    // Target label for a node.
    std::string label(const std::string& code, const std::string& display_name) const;

    // Label prefix shared by every label of `code` ("[code]"), empty for
    // PlainName profiles.
    std::string label_prefix(const std::string& code) const;
};

// Sankhya TGFGRU -> Odoo product.category
HierarchyProfile category_profile();

// Sankhya TGFLOC -> Odoo stock.location
HierarchyProfile location_profile();

std::optional<HierarchyProfile> find_profile(const std::string& name);

} // namespace canopy
