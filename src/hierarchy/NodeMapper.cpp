#include "hierarchy/NodeMapper.hpp"
#include <cmath>
#include <limits>

using json = nlohmann::json;

namespace canopy {

static std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string cell_text(const json& v) {
    if (v.is_null()) return "";
    if (v.is_string()) return trim(v.get<std::string>());
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && d == std::floor(d) &&
            std::fabs(d) < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::to_string(static_cast<int64_t>(d));
        }
        return v.dump();
    }
    if (v.is_boolean()) return v.get<bool>() ? "true" : "false";
    return v.dump();
}

std::optional<int> cell_level(const json& v) {
    if (v.is_number_integer()) {
        int64_t n = v.get<int64_t>();
        if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(n);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d) || d != std::floor(d) ||
            std::fabs(d) > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(d);
    }
    if (v.is_string()) {
        std::string s = trim(v.get<std::string>());
        if (s.empty()) return std::nullopt;
        try {
            size_t used = 0;
            int n = std::stoi(s, &used);
            if (used != s.size()) return std::nullopt;
            return n;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

Node to_node(const json& row, const FieldMapping& mapping) {
    Node n;
    if (!row.is_object()) return n;
    n.external_code = cell_text(row.value(mapping.code, json()));
    n.parent_code   = cell_text(row.value(mapping.parent, json()));
    n.display_name  = cell_text(row.value(mapping.name, json()));
    n.level         = cell_level(row.value(mapping.level, json()));
    return n;
}

std::vector<Node> to_nodes(const std::vector<json>& rows, const FieldMapping& mapping) {
    std::vector<Node> out;
    out.reserve(rows.size());
    for (const auto& r : rows) {
        out.push_back(to_node(r, mapping));
    }
    return out;
}

} // namespace canopy
