#include "source/JsonFileReader.hpp"
#include "source/SankhyaGatewayReader.hpp"
#include <fstream>
#include <iostream>

using namespace canopy;
using json = nlohmann::json;

JsonFileReader::JsonFileReader(std::string path) : path_(std::move(path)) {}

std::vector<json> JsonFileReader::rows_from(const json& doc) {
    if (doc.is_array()) {
        for (const auto& r : doc) {
            if (!r.is_object()) throw SourceError("Row is not an object: " + r.dump());
        }
        return doc.get<std::vector<json>>();
    }
    if (doc.is_object() && doc.contains("rows") && doc["rows"].is_array() &&
        !doc.contains("fieldsMetadata")) {
        return rows_from(doc["rows"]);
    }
    if (doc.is_object()) {
        return SankhyaGatewayReader::parse_query_reply(doc);
    }
    throw SourceError("Unrecognised batch document");
}

std::vector<json> JsonFileReader::read() {
    std::ifstream in(path_);
    if (!in.is_open()) {
        throw SourceError("[SOURCE] Cannot open " + path_);
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw SourceError("[SOURCE] " + path_ + ": " + e.what());
    }

    auto rows = rows_from(doc);
    std::cout << "[SOURCE] " << rows.size() << " rows read from " << path_ << "\n";
    return rows;
}
