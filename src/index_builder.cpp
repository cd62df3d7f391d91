#include "moderag/index_builder.hpp"
#include "moderag/errors.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

namespace moderag {

std::shared_ptr<LocalVectorIndex> buildIndex(const EmbeddingGateway& embedder,
                                             ExampleStore store,
                                             MetricType metric,
                                             size_t batchSize) {
    if (store.empty()) {
        throw ModerationError(ErrorKind::INDEX_EMPTY, "no examples to index");
    }
    if (batchSize == 0) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "batch size must be positive");
    }

    const auto start = std::chrono::steady_clock::now();
    spdlog::info("Embedding {} examples in batches of {}", store.size(), batchSize);
    auto vectors = embedder.embedBatched(store.texts(), batchSize);
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("Embedded {} examples in {:.1f}s", vectors.size(), seconds);

    return LocalVectorIndex::build(std::move(store), vectors, metric);
}

std::shared_ptr<LocalVectorIndex> buildIndexFile(const EmbeddingGateway& embedder,
                                                 const std::filesystem::path& corpus,
                                                 const std::filesystem::path& outputDir,
                                                 MetricType metric,
                                                 size_t batchSize) {
    auto index = buildIndex(embedder, ExampleStore::loadJsonl(corpus), metric, batchSize);
    index->save(outputDir);
    return index;
}

} // namespace moderag
