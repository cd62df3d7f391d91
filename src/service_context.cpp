#include "moderag/service_context.hpp"
#include "moderag/errors.hpp"
#include "moderag/local_index.hpp"
#include "moderag/warehouse_index.hpp"

#include <spdlog/spdlog.h>

namespace moderag {

ServiceContext::ServiceContext(ServiceConfig config)
    : ServiceContext(config, std::make_shared<CurlTransport>(config.http_pool_size)) {}

ServiceContext::ServiceContext(ServiceConfig config, std::shared_ptr<Transport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
    embedder_ = std::make_shared<EmbeddingGateway>(transport_, config_.embedding, config_.retryPolicy());
    generator_ = std::make_shared<GenerationGateway>(transport_, config_.generation, config_.retryPolicy());
    index_ = std::make_shared<IndexHolder>();

    OrchestratorSettings settings;
    settings.temperature = config_.temperature;
    settings.version = config_.version;
    orchestrator_ = std::make_unique<ClassificationOrchestrator>(
        embedder_, generator_, index_, PromptAssembler(), ResponseParser(config_.parser), settings);
}

void ServiceContext::loadConfiguredIndex() {
    if (config_.index_backend == IndexBackend::WAREHOUSE) {
        installIndex(std::make_shared<WarehouseVectorIndex>(transport_, config_.warehouse, config_.retryPolicy()));
        return;
    }
    if (!std::filesystem::exists(std::filesystem::path(config_.index_path) / LocalVectorIndex::kIndexFile)) {
        spdlog::warn("No index found at {}, serving without one until a reload", config_.index_path);
        return;
    }
    reloadIndex(config_.index_path);
}

void ServiceContext::reloadIndex(const std::filesystem::path& dir) {
    installIndex(LocalVectorIndex::load(dir));
}

void ServiceContext::installIndex(std::shared_ptr<const VectorIndex> index) {
    if (!index) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "cannot install a null index");
    }
    const std::string description = index->describe();
    auto previous = index_->publish(std::move(index));
    if (previous) {
        spdlog::info("Swapped serving index {} for {}", previous->describe(), description);
    } else {
        spdlog::info("Serving index {}", description);
    }
}

} // namespace moderag
