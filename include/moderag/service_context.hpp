#pragma once

#include <filesystem>
#include <memory>

#include "moderag/config.hpp"
#include "moderag/http_transport.hpp"
#include "moderag/index_holder.hpp"
#include "moderag/orchestrator.hpp"

namespace moderag {

// Everything a request handler needs, built once at startup and passed
// explicitly. The index is the only part that changes after construction.
class ServiceContext {
public:
    // Uses a CurlTransport sized by config.http_pool_size.
    explicit ServiceContext(ServiceConfig config);
    ServiceContext(ServiceConfig config, std::shared_ptr<Transport> transport);

    ServiceContext(const ServiceContext&) = delete;
    ServiceContext& operator=(const ServiceContext&) = delete;

    // Installs the index named by the configuration. A missing local index
    // leaves the service running without one.
    void loadConfiguredIndex();

    // Loads a local index completely before publishing it.
    void reloadIndex(const std::filesystem::path& dir);
    void installIndex(std::shared_ptr<const VectorIndex> index);

    const ServiceConfig& config() const { return config_; }
    ClassificationOrchestrator& orchestrator() { return *orchestrator_; }
    const ClassificationOrchestrator& orchestrator() const { return *orchestrator_; }
    const IndexHolder& index() const { return *index_; }
    const EmbeddingGateway& embedder() const { return *embedder_; }
    std::shared_ptr<Transport> transport() const { return transport_; }

private:
    ServiceConfig config_;
    std::shared_ptr<Transport> transport_;
    std::shared_ptr<EmbeddingGateway> embedder_;
    std::shared_ptr<GenerationGateway> generator_;
    std::shared_ptr<IndexHolder> index_;
    std::unique_ptr<ClassificationOrchestrator> orchestrator_;
};

} // namespace moderag
