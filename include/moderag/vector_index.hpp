#pragma once

#include <string>
#include <vector>

#include "moderag/models.hpp"
#include "moderag/retry_policy.hpp"

namespace moderag {

// k-nearest-neighbour search over fixed-dimension vectors. Results come back
// ordered by ascending distance; fewer than k when the index holds fewer rows.
// Implementations are immutable once built and safe for concurrent readers.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    // stats, when given, receives the number of network calls made.
    virtual std::vector<RetrievedExample> search(const std::vector<float>& query,
                                                 int k,
                                                 CallStats* stats) const = 0;

    std::vector<RetrievedExample> search(const std::vector<float>& query, int k) const {
        return search(query, k, nullptr);
    }

    // Rows held in process; 0 for indexes that live behind the network.
    virtual size_t size() const = 0;
    virtual bool remote() const = 0;
    virtual std::string describe() const = 0;
};

} // namespace moderag
