#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "moderag/http_transport.hpp"
#include "moderag/retry_policy.hpp"
#include "moderag/vector_index.hpp"

namespace moderag {

struct WarehouseSettings {
    std::string endpoint = "https://bigquery.googleapis.com/bigquery/v2";
    std::string project;
    std::string dataset;
    std::string table;
    std::string access_token;
    MetricType metric = MetricType::COSINE;
    double fraction_lists_to_search = 0.15;
    bool use_brute_force = false;
    // 0 leaves the query dimension unchecked.
    size_t dimension = 0;
    std::chrono::milliseconds timeout{30000};
};

// Remote index backed by a BigQuery table with an `embedding` column, queried
// through jobs.query with VECTOR_SEARCH. The query vector travels as a named
// ARRAY<FLOAT64> parameter; the table, top_k, distance type and options are
// validated and inlined.
class WarehouseVectorIndex : public VectorIndex {
public:
    WarehouseVectorIndex(std::shared_ptr<Transport> transport,
                         WarehouseSettings settings,
                         RetryPolicy retry = RetryPolicy());

    using VectorIndex::search;
    std::vector<RetrievedExample> search(const std::vector<float>& query,
                                         int k,
                                         CallStats* stats) const override;
    size_t size() const override { return 0; }
    bool remote() const override { return true; }
    std::string describe() const override;

    std::string buildQuery(int k) const;
    nlohmann::json buildRequest(const std::vector<float>& query, int k) const;

    const WarehouseSettings& settings() const { return settings_; }

private:
    std::shared_ptr<Transport> transport_;
    WarehouseSettings settings_;
    RetryPolicy retry_;

    std::vector<RetrievedExample> decode(const nlohmann::json& body) const;
};

} // namespace moderag
