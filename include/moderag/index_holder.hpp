#pragma once

#include <atomic>
#include <memory>

#include "moderag/vector_index.hpp"

namespace moderag {

// Single swap point for the serving index. Readers take a snapshot and keep
// it alive for the whole request; a reload publishes a fully built index in
// one store, so no reader ever sees a partially built one.
class IndexHolder {
public:
    IndexHolder() = default;
    explicit IndexHolder(std::shared_ptr<const VectorIndex> index) : index_(std::move(index)) {}

    IndexHolder(const IndexHolder&) = delete;
    IndexHolder& operator=(const IndexHolder&) = delete;

    std::shared_ptr<const VectorIndex> snapshot() const { return index_.load(std::memory_order_acquire); }

    // Returns the index that was replaced.
    std::shared_ptr<const VectorIndex> publish(std::shared_ptr<const VectorIndex> index) {
        return index_.exchange(std::move(index), std::memory_order_acq_rel);
    }

private:
    std::atomic<std::shared_ptr<const VectorIndex>> index_;
};

} // namespace moderag
