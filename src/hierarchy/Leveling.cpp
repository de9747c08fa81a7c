#include "hierarchy/Leveling.hpp"
#include <algorithm>

namespace canopy {

bool level_before(const Node& a, const Node& b) {
    int la = a.level.value_or(UNLEVELED);
    int lb = b.level.value_or(UNLEVELED);
    if (la != lb) return la < lb;
    return a.external_code < b.external_code;
}

std::vector<Node> level_order(std::vector<Node> nodes) {
    // stable: duplicate codes keep their submission order
    std::stable_sort(nodes.begin(), nodes.end(), level_before);
    return nodes;
}

} // namespace canopy
