#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "moderag/example_store.hpp"
#include "moderag/vector_index.hpp"

namespace moderag {

// Exact brute-force search over row-major float32 vectors.
class FlatIndex {
public:
    static constexpr uint32_t kMagic = 0x4952464D; // "MFRI" little-endian
    static constexpr uint32_t kVersion = 1;

    FlatIndex(size_t dimension, MetricType metric);

    void add(const std::vector<float>& vector);

    // (row, distance) pairs, nearest first; equal distances keep row order.
    std::vector<std::pair<size_t, float>> search(const std::vector<float>& query, int k) const;

    float distance(const float* a, const float* b) const;

    size_t size() const { return count_; }
    size_t dimension() const { return dimension_; }
    MetricType metric() const { return metric_; }
    const float* row(size_t i) const { return data_.data() + i * dimension_; }

    void save(const std::filesystem::path& path) const;
    static FlatIndex load(const std::filesystem::path& path);

private:
    size_t dimension_;
    MetricType metric_;
    size_t count_ = 0;
    std::vector<float> data_;
};

// In-process index: a FlatIndex plus the ExampleStore it is aligned with.
// Persisted as a directory holding index.bin and metadata.jsonl.
class LocalVectorIndex : public VectorIndex {
public:
    static constexpr const char* kIndexFile = "index.bin";
    static constexpr const char* kMetadataFile = "metadata.jsonl";

    static std::shared_ptr<LocalVectorIndex> build(ExampleStore store,
                                                   const std::vector<std::vector<float>>& vectors,
                                                   MetricType metric = MetricType::EUCLIDEAN);
    static std::shared_ptr<LocalVectorIndex> load(const std::filesystem::path& dir);

    void save(const std::filesystem::path& dir) const;

    using VectorIndex::search;
    std::vector<RetrievedExample> search(const std::vector<float>& query,
                                         int k,
                                         CallStats* stats) const override;
    size_t size() const override { return flat_.size(); }
    bool remote() const override { return false; }
    std::string describe() const override;

    size_t dimension() const { return flat_.dimension(); }
    MetricType metric() const { return flat_.metric(); }
    const ExampleStore& store() const { return store_; }
    const FlatIndex& flat() const { return flat_; }

private:
    LocalVectorIndex(FlatIndex flat, ExampleStore store);

    FlatIndex flat_;
    ExampleStore store_;
};

} // namespace moderag
