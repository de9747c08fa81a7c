#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "hierarchy/Node.hpp"
#include "store/MemoryStore.hpp"

namespace canopy {
namespace test {

using json = nlohmann::json;

// product.category as a stock Odoo exposes it, optionally with the custom
// x_ fields some installations add.
inline json category_fields(bool with_custom_fields) {
    json f = {
        {"name", {{"type", "char"}}},
        {"complete_name", {{"type", "char"}}},
        {"parent_id", {{"type", "many2one"}, {"relation", "product.category"}}}
    };
    if (with_custom_fields) {
        f["x_sankhya_id"] = {{"type", "char"}};
        f["x_parent_sankhya_id"] = {{"type", "char"}};
        f["x_grau"] = {{"type", "integer"}};
    }
    return f;
}

inline json location_fields() {
    return {
        {"name", {{"type", "char"}}},
        {"barcode", {{"type", "char"}}},
        {"usage", {{"type", "selection"}}},
        {"active", {{"type", "boolean"}}},
        {"location_id", {{"type", "many2one"}, {"relation", "stock.location"}}}
    };
}

inline json warehouse_fields() {
    return {
        {"name", {{"type", "char"}}},
        {"lot_stock_id", {{"type", "many2one"}, {"relation", "stock.location"}}}
    };
}

// Store with product.category and its "All" root. Returns the root id.
inline RecordId seed_categories(MemoryStore& store, bool with_custom_fields = false) {
    store.define_model("product.category", category_fields(with_custom_fields), "parent_id");
    return store.seed("product.category", {{"name", "All"}, {"parent_id", false}});
}

// Store with WH/Stock under a view location and one warehouse pointing at
// it. Returns the WH/Stock id.
inline RecordId seed_locations(MemoryStore& store) {
    store.define_model("stock.location", location_fields(), "location_id");
    store.define_model("stock.warehouse", warehouse_fields());
    RecordId view = store.seed("stock.location",
                               {{"name", "WH"}, {"usage", "view"}, {"active", true}});
    RecordId stock = store.seed("stock.location",
                                {{"name", "Stock"}, {"usage", "internal"}, {"active", true},
                                 {"location_id", view}});
    store.seed("stock.warehouse", {{"name", "WH"}, {"lot_stock_id", stock}});
    return stock;
}

inline Node node(const std::string& code, const std::string& parent,
                 const std::string& name = "", int level = 0) {
    Node n;
    n.external_code = code;
    n.parent_code = parent;
    n.display_name = name.empty() ? "Group " + code : name;
    if (level > 0) n.level = level;
    return n;
}

} // namespace test
} // namespace canopy
