#include "moderag/config.hpp"
#include "moderag/errors.hpp"
#include "moderag/http_server.hpp"
#include "moderag/service_context.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

#include <spdlog/spdlog.h>

int main() {
    try {
        moderag::ServiceConfig config = moderag::ServiceConfig::fromEnvironment();
        moderag::applyLogLevel(config.log_level);

        spdlog::info("moderag {} starting", config.version);
        spdlog::info("Embedding endpoint {} ({})", config.embedding.base_url, config.embedding.model);
        spdlog::info("Generation endpoint {} ({})", config.generation.base_url, config.generation.model);

        moderag::ServiceContext context(config);
        context.loadConfiguredIndex();

        size_t workers = config.server_threads;
        if (workers == 0) {
            workers = std::max(4u, std::thread::hardware_concurrency() * 2);
        }
        moderag::HttpServer server(context, config.host, config.port, workers);
        if (config.index_backend == moderag::IndexBackend::LOCAL) {
            server.setReloadHandler([&context, path = config.index_path] { context.reloadIndex(path); });
        }
        server.run(std::max(1u, std::thread::hardware_concurrency() / 2));
        spdlog::info("moderag stopped");
    } catch (const moderag::ModerationError& e) {
        std::cerr << "Startup error: " << e.what() << " (kind: " << moderag::toString(e.kind) << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
