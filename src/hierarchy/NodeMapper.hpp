#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "hierarchy/HierarchyProfile.hpp"
#include "hierarchy/Node.hpp"

namespace canopy {

// Scalar cell as trimmed text: integers without decimals, null as "".
std::string cell_text(const nlohmann::json& v);

// Depth hint from an integer, an integral float or a numeric string.
std::optional<int> cell_level(const nlohmann::json& v);

// Builds a Node from one source row. Rows with an empty code are kept: they
// are rejected (and counted) when pass A reaches them.
Node to_node(const nlohmann::json& row, const FieldMapping& mapping);

std::vector<Node> to_nodes(const std::vector<nlohmann::json>& rows, const FieldMapping& mapping);

} // namespace canopy
