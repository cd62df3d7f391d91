#pragma once

#include <filesystem>
#include <memory>

#include "moderag/example_store.hpp"
#include "moderag/gateways.hpp"
#include "moderag/local_index.hpp"

namespace moderag {

// Embeds every example of `store` in batches and builds a LocalVectorIndex
// over the result. Nothing is published; the caller saves or installs it.
std::shared_ptr<LocalVectorIndex> buildIndex(const EmbeddingGateway& embedder,
                                             ExampleStore store,
                                             MetricType metric = MetricType::EUCLIDEAN,
                                             size_t batchSize = 32);

// Corpus file in, index directory out.
std::shared_ptr<LocalVectorIndex> buildIndexFile(const EmbeddingGateway& embedder,
                                                 const std::filesystem::path& corpus,
                                                 const std::filesystem::path& outputDir,
                                                 MetricType metric = MetricType::EUCLIDEAN,
                                                 size_t batchSize = 32);

} // namespace moderag
