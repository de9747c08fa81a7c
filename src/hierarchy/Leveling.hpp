#pragma once
#include <vector>

#include "hierarchy/Node.hpp"

namespace canopy {

// Shallow before deep: ascending level, unleveled nodes last, ties by code.
// Only reduces forward references; correctness never depends on it.
bool level_before(const Node& a, const Node& b);

std::vector<Node> level_order(std::vector<Node> nodes);

} // namespace canopy
