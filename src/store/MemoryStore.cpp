#include "store/MemoryStore.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>

using namespace canopy;
using json = nlohmann::json;

static bool is_many2one(const json& field_types, const std::string& field) {
    auto it = field_types.find(field);
    return it != field_types.end() && it->value("type", std::string()) == "many2one";
}

static bool is_empty_value(const json& v) {
    return v.is_null() || (v.is_boolean() && !v.get<bool>());
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ---------------------------------------------------------------------------

bool MemoryStore::like_match(const std::string& text, const std::string& pattern, bool icase) {
    const std::string t = icase ? to_lower(text) : text;
    const std::string p = icase ? to_lower(pattern) : pattern;

    // Iterative wildcard match with single-star backtracking.
    size_t ti = 0, pi = 0;
    size_t star = std::string::npos, mark = 0;
    while (ti < t.size()) {
        if (pi < p.size() && (p[pi] == '_' || p[pi] == t[ti])) {
            ++ti; ++pi;
        } else if (pi < p.size() && p[pi] == '%') {
            star = pi++;
            mark = ti;
        } else if (star != std::string::npos) {
            pi = star + 1;
            ti = ++mark;
        } else {
            return false;
        }
    }
    while (pi < p.size() && p[pi] == '%') ++pi;
    return pi == p.size();
}

void MemoryStore::define_model(const std::string& model,
                               const json& field_types,
                               const std::string& parent_field) {
    Model& m = models_[model];
    m.field_types = field_types;
    m.parent_field = parent_field;
}

MemoryStore::Model& MemoryStore::model_ref(const std::string& model) {
    auto it = models_.find(model);
    if (it == models_.end()) {
        throw StoreError("Object " + model + " doesn't exist");
    }
    return it->second;
}

const MemoryStore::Model& MemoryStore::model_ref(const std::string& model) const {
    auto it = models_.find(model);
    if (it == models_.end()) {
        throw StoreError("Object " + model + " doesn't exist");
    }
    return it->second;
}

json MemoryStore::normalize(const std::string& model, const Model& m, const json& values) const {
    if (!values.is_object()) {
        throw StoreError("Values for " + model + " must be a mapping");
    }
    json out = json::object();
    for (auto it = values.begin(); it != values.end(); ++it) {
        const std::string& field = it.key();
        if (field == "id" || !m.field_types.contains(field)) {
            throw StoreError("Invalid field '" + field + "' on model '" + model + "'");
        }
        if (!is_many2one(m.field_types, field)) {
            out[field] = it.value();
            continue;
        }
        if (is_empty_value(it.value())) {
            out[field] = nullptr;
            continue;
        }
        auto ref = many2one_id(it.value());
        if (!ref) {
            throw StoreError("Bad many2one value for " + model + "." + field);
        }
        const std::string relation = m.field_types[field].value("relation", model);
        if (!exists(relation, *ref)) {
            throw StoreError("Record " + relation + "(" + std::to_string(*ref) +
                             ") does not exist (" + model + "." + field + ")");
        }
        out[field] = *ref;
    }
    return out;
}

void MemoryStore::check_recursion(const Model& m, RecordId id, const json& values) const {
    if (m.parent_field.empty() || !values.contains(m.parent_field)) return;
    const json& parent = values[m.parent_field];
    if (!parent.is_number_integer()) return;

    std::unordered_set<RecordId> seen;
    RecordId cur = parent.get<RecordId>();
    while (true) {
        if (cur == id) {
            throw StoreError("Recursion Detected.");
        }
        if (!seen.insert(cur).second) return;
        auto it = m.rows.find(cur);
        if (it == m.rows.end()) return;
        const json& up = it->second.value(m.parent_field, json());
        if (!up.is_number_integer()) return;
        cur = up.get<RecordId>();
    }
}

RecordId MemoryStore::seed(const std::string& model, const json& values) {
    Model& m = model_ref(model);
    json row = normalize(model, m, values);
    RecordId id = next_id_++;
    row["id"] = id;
    m.rows[id] = row;
    return id;
}

RecordId MemoryStore::create(const std::string& model, const json& values) {
    ++counters_.create;
    if (hook_) hook_("create", model, values);

    Model& m = model_ref(model);
    json row = normalize(model, m, values);
    RecordId id = next_id_++;
    row["id"] = id;
    m.rows[id] = row;
    return id;
}

bool MemoryStore::update(const std::string& model, RecordId id, const json& values) {
    ++counters_.update;
    if (hook_) hook_("update", model, values);

    Model& m = model_ref(model);
    auto it = m.rows.find(id);
    if (it == m.rows.end()) {
        throw StoreError("Record " + model + "(" + std::to_string(id) + ") does not exist");
    }
    json row = normalize(model, m, values);
    check_recursion(m, id, row);
    for (auto f = row.begin(); f != row.end(); ++f) {
        it->second[f.key()] = f.value();
    }
    return true;
}

json MemoryStore::fields(const std::string& model) {
    ++counters_.fields;
    return model_ref(model).field_types;
}

bool MemoryStore::matches(const Model& m, const Record& row, const json& domain) const {
    if (domain.is_null()) return true;
    if (!domain.is_array()) throw StoreError("Domain must be a list");

    for (const auto& term : domain) {
        if (!term.is_array() || term.size() != 3 || !term[0].is_string() || !term[1].is_string()) {
            throw StoreError("Invalid domain term: " + term.dump());
        }
        const std::string field = term[0].get<std::string>();
        const std::string op = term[1].get<std::string>();
        const json& want = term[2];

        if (field != "id" && !m.field_types.contains(field)) {
            throw StoreError("Invalid field '" + field + "' in domain");
        }
        json have = row.value(field, json());

        bool ok = false;
        if (op == "=" || op == "!=") {
            bool eq;
            if (is_empty_value(want)) {
                eq = is_empty_value(have);
            } else if (is_many2one(m.field_types, field)) {
                auto ref = many2one_id(want);
                eq = ref && have.is_number_integer() && have.get<RecordId>() == *ref;
            } else {
                eq = (have == want);
            }
            ok = (op == "=") ? eq : !eq;
        } else if (op == "like" || op == "ilike" || op == "=like" || op == "=ilike") {
            if (!have.is_string() || !want.is_string()) {
                ok = false;
            } else {
                std::string pattern = want.get<std::string>();
                if (op[0] != '=') pattern = "%" + pattern + "%";
                ok = like_match(have.get<std::string>(), pattern,
                                op == "ilike" || op == "=ilike");
            }
        } else if (op == "in" || op == "not in") {
            if (!want.is_array()) throw StoreError("Operator " + op + " expects a list");
            bool found = std::find(want.begin(), want.end(), have) != want.end();
            ok = (op == "in") ? found : !found;
        } else {
            throw StoreError("Unsupported domain operator: " + op);
        }
        if (!ok) return false;
    }
    return true;
}

Record MemoryStore::project(const Model& m, const Record& row,
                            const std::vector<std::string>& fields) const {
    std::vector<std::string> wanted = fields;
    if (wanted.empty()) {
        for (auto it = m.field_types.begin(); it != m.field_types.end(); ++it) {
            wanted.push_back(it.key());
        }
    }

    Record out = json::object();
    out["id"] = row["id"];
    for (const auto& f : wanted) {
        if (f == "id") continue;
        if (!m.field_types.contains(f)) {
            throw StoreError("Invalid field '" + f + "' requested");
        }
        json v = row.value(f, json());
        if (is_many2one(m.field_types, f)) {
            if (v.is_number_integer()) {
                const std::string relation = m.field_types[f].value("relation", std::string());
                std::string label;
                if (exists(relation, v.get<RecordId>())) {
                    label = get(relation, v.get<RecordId>()).value("name", std::string());
                }
                out[f] = json::array({v, label});
            } else {
                out[f] = false;
            }
        } else {
            out[f] = v.is_null() ? json(false) : v;
        }
    }
    return out;
}

std::vector<Record> MemoryStore::search(const std::string& model,
                                        const json& domain,
                                        const std::vector<std::string>& fields,
                                        int limit) {
    ++counters_.search;
    const Model& m = model_ref(model);

    std::vector<Record> out;
    for (const auto& kv : m.rows) {
        if (limit > 0 && static_cast<int>(out.size()) >= limit) break;
        if (matches(m, kv.second, domain)) {
            out.push_back(project(m, kv.second, fields));
        }
    }
    return out;
}

const Record& MemoryStore::get(const std::string& model, RecordId id) const {
    const Model& m = model_ref(model);
    auto it = m.rows.find(id);
    if (it == m.rows.end()) {
        throw StoreError("Record " + model + "(" + std::to_string(id) + ") does not exist");
    }
    return it->second;
}

bool MemoryStore::exists(const std::string& model, RecordId id) const {
    auto it = models_.find(model);
    return it != models_.end() && it->second.rows.count(id) > 0;
}

size_t MemoryStore::count(const std::string& model) const {
    return model_ref(model).rows.size();
}

std::vector<RecordId> MemoryStore::ids(const std::string& model) const {
    std::vector<RecordId> out;
    for (const auto& kv : model_ref(model).rows) out.push_back(kv.first);
    return out;
}
