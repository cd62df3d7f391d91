#include "moderag/warehouse_index.hpp"
#include "moderag/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace moderag {

namespace {

bool validIdentifier(const std::string& id, bool allowDash) {
    if (id.empty()) return false;
    return std::all_of(id.begin(), id.end(), [allowDash](unsigned char c) {
        return std::isalnum(c) || c == '_' || (allowDash && c == '-');
    });
}

ModerationError malformed(const std::string& what) {
    return ModerationError(ErrorKind::MALFORMED_RESPONSE, what, 200);
}

// BigQuery REST rows look like {"f": [{"v": "..."}, ...]}; every scalar is a string.
const nlohmann::json& cell(const nlohmann::json& row, size_t column) {
    if (!row.is_object() || !row.contains("f") || !row.at("f").is_array() || row.at("f").size() <= column) {
        throw malformed("warehouse row is missing column " + std::to_string(column));
    }
    const auto& c = row.at("f").at(column);
    if (!c.is_object() || !c.contains("v")) {
        throw malformed("warehouse cell has no value");
    }
    return c.at("v");
}

} // namespace

WarehouseVectorIndex::WarehouseVectorIndex(std::shared_ptr<Transport> transport,
                                           WarehouseSettings settings,
                                           RetryPolicy retry)
    : transport_(std::move(transport)), settings_(std::move(settings)), retry_(std::move(retry)) {
    if (!validIdentifier(settings_.project, true)) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "invalid warehouse project '" + settings_.project + "'");
    }
    if (!validIdentifier(settings_.dataset, false) || !validIdentifier(settings_.table, false)) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT,
                              "invalid warehouse table '" + settings_.dataset + "." + settings_.table + "'");
    }
    if (!(settings_.fraction_lists_to_search > 0.0 && settings_.fraction_lists_to_search <= 1.0)) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "fraction_lists_to_search must be in (0, 1]");
    }
}

std::string WarehouseVectorIndex::buildQuery(int k) const {
    nlohmann::json options = {
        {"fraction_lists_to_search", settings_.fraction_lists_to_search},
        {"use_brute_force", settings_.use_brute_force},
    };
    return fmt::format(
        "SELECT base.text, base.moderation_category, distance\n"
        "FROM VECTOR_SEARCH(\n"
        "  TABLE `{}.{}`,\n"
        "  'embedding',\n"
        "  (SELECT @embedding),\n"
        "  top_k => {},\n"
        "  distance_type => '{}',\n"
        "  options => '{}'\n"
        ")\n"
        "ORDER BY distance\n"
        "LIMIT {}",
        settings_.dataset, settings_.table, k, toString(settings_.metric), options.dump(), k);
}

nlohmann::json WarehouseVectorIndex::buildRequest(const std::vector<float>& query, int k) const {
    nlohmann::json values = nlohmann::json::array();
    for (float v : query) {
        // Values travel as strings in the REST representation.
        values.push_back({{"value", fmt::format("{}", v)}});
    }
    nlohmann::json parameter = {
        {"name", "embedding"},
        {"parameterType", {{"type", "ARRAY"}, {"arrayType", {{"type", "FLOAT64"}}}}},
        {"parameterValue", {{"arrayValues", values}}},
    };
    return {
        {"query", buildQuery(k)},
        {"useLegacySql", false},
        {"parameterMode", "NAMED"},
        {"queryParameters", nlohmann::json::array({parameter})},
        {"timeoutMs", settings_.timeout.count()},
    };
}

std::vector<RetrievedExample> WarehouseVectorIndex::search(const std::vector<float>& query,
                                                           int k,
                                                           CallStats* stats) const {
    if (k <= 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "k must be positive, got " + std::to_string(k));
    }
    if (query.empty() || (settings_.dimension != 0 && query.size() != settings_.dimension)) {
        throw ModerationError(ErrorKind::DIMENSION_MISMATCH,
                              "query has dimension " + std::to_string(query.size()) +
                              ", warehouse table expects " + std::to_string(settings_.dimension));
    }
    if (!std::all_of(query.begin(), query.end(), [](float v) { return std::isfinite(v); })) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "query vector holds a non-finite value");
    }

    const nlohmann::json body = buildRequest(query, k);
    const std::string url = joinUrl(settings_.endpoint,
                                    "projects/" + encodePathParam(settings_.project) + "/queries");

    auto results = retry_.execute([&] {
        auto response = postJson(*transport_, url, body, settings_.access_token,
                                 settings_.timeout + std::chrono::milliseconds(5000), "warehouse");
        return decode(response);
    }, stats, "warehouse vector search");

    if (results.empty()) {
        throw ModerationError(ErrorKind::INDEX_EMPTY,
                              "warehouse table " + settings_.dataset + "." + settings_.table + " returned no rows");
    }
    if (results.size() > static_cast<size_t>(k)) {
        results.resize(static_cast<size_t>(k));
    }
    spdlog::debug("Warehouse vector search returned {} results", results.size());
    return results;
}

std::vector<RetrievedExample> WarehouseVectorIndex::decode(const nlohmann::json& body) const {
    if (!body.is_object()) {
        throw malformed("warehouse response is not an object");
    }
    if (body.contains("jobComplete") && body.at("jobComplete").is_boolean() &&
        !body.at("jobComplete").get<bool>()) {
        throw ModerationError(ErrorKind::UNREACHABLE, "warehouse query did not complete within the timeout");
    }

    size_t textCol = 0, categoryCol = 1, distanceCol = 2;
    if (body.contains("schema") && body.at("schema").is_object() && body.at("schema").contains("fields") &&
        body.at("schema").at("fields").is_array()) {
        const auto& fields = body.at("schema").at("fields");
        for (size_t i = 0; i < fields.size(); ++i) {
            const auto& field = fields.at(i);
            if (!field.is_object() || !field.contains("name") || !field.at("name").is_string()) continue;
            const std::string name = field.at("name").get<std::string>();
            if (name == "text") textCol = i;
            else if (name == "moderation_category") categoryCol = i;
            else if (name == "distance") distanceCol = i;
        }
    }

    std::vector<RetrievedExample> results;
    if (!body.contains("rows")) {
        return results;
    }
    if (!body.at("rows").is_array()) {
        throw malformed("warehouse response 'rows' is not an array");
    }

    for (const auto& row : body.at("rows")) {
        const auto& text = cell(row, textCol);
        const auto& category = cell(row, categoryCol);
        const auto& distance = cell(row, distanceCol);
        if (!text.is_string() || !category.is_string() || !distance.is_string()) {
            throw malformed("warehouse row has a null or non-string cell");
        }

        RetrievedExample example;
        example.text = text.get<std::string>();
        bool known = false;
        example.category = CategoryTaxonomy::validate(category.get<std::string>(), &known);
        if (!known) {
            spdlog::warn("Warehouse row carries unknown category '{}', using '{}'",
                         category.get<std::string>(), toString(example.category));
        }
        try {
            example.distance = std::stof(distance.get<std::string>());
        } catch (const std::exception&) {
            throw malformed("warehouse distance '" + distance.get<std::string>() + "' is not numeric");
        }
        results.push_back(std::move(example));
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const RetrievedExample& a, const RetrievedExample& b) { return a.distance < b.distance; });
    return results;
}

std::string WarehouseVectorIndex::describe() const {
    return fmt::format("warehouse {} index {}.{}.{} (fraction_lists_to_search={}, use_brute_force={})",
                       toString(settings_.metric), settings_.project, settings_.dataset, settings_.table,
                       settings_.fraction_lists_to_search, settings_.use_brute_force);
}

} // namespace moderag
