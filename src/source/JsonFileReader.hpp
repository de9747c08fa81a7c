#pragma once
#include <string>

#include "source/SourceReader.hpp"

namespace canopy {

// Batch exported to disk. Accepts a top-level array of row objects,
// {"rows": [ {...}, ... ]}, or a saved gateway reply / responseBody.
class JsonFileReader : public ISourceReader {
public:
    explicit JsonFileReader(std::string path);

    std::vector<nlohmann::json> read() override;

    static std::vector<nlohmann::json> rows_from(const nlohmann::json& doc);

private:
    std::string path_;
};

} // namespace canopy
