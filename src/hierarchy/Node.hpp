#pragma once
#include <optional>
#include <string>

#include "store/TargetStore.hpp"

namespace canopy {

// Source convention for "this node is a root".
inline const std::string NO_PARENT = "0";

// Depth used for ordering when the source gives no usable level.
constexpr int UNLEVELED = 999999;

// One hierarchical record of the current run. Lives in memory only; the
// target record it produces is addressable again next run by external_code.
struct Node {
    std::string external_code;
    std::string parent_code;
    std::string display_name;
    std::optional<int> level;
    std::optional<RecordId> target_id;   // set in pass A, never unset

    bool is_root() const {
        return parent_code.empty() || parent_code == NO_PARENT;
    }

    bool is_self_reference() const {
        return !is_root() && parent_code == external_code;
    }
};

} // namespace canopy
