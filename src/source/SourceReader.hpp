#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace canopy {

class SourceError : public std::runtime_error {
public:
    explicit SourceError(const std::string& what) : std::runtime_error(what) {}
};

// Source system of record. Returns the whole batch at once, unordered,
// one JSON object per row (column name -> value).
class ISourceReader {
public:
    virtual ~ISourceReader() = default;
    virtual std::vector<nlohmann::json> read() = 0;
};

} // namespace canopy
