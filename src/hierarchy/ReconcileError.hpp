#pragma once
#include <stdexcept>
#include <string>

namespace canopy {

// Fatal to the whole run: nothing can be anchored or identified.
class ReconcileError : public std::runtime_error {
public:
    explicit ReconcileError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace canopy
