#include "moderag/config.hpp"
#include "moderag/errors.hpp"
#include "moderag/http_transport.hpp"
#include "moderag/index_builder.hpp"

#include <iostream>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    std::string input;
    std::string output;
    std::string metricName = "EUCLIDEAN";
    size_t batchSize = 32;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--input" && i + 1 < argc) {
                input = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                output = argv[++i];
            } else if (arg == "--metric" && i + 1 < argc) {
                metricName = argv[++i];
            } else if (arg == "--batch-size" && i + 1 < argc) {
                batchSize = std::stoull(argv[++i]);
            } else if (arg == "--help") {
                std::cout << "Builds a local moderag index from a labeled JSONL corpus" << std::endl;
                std::cout << "Usage: " << argv[0] << " --input FILE --output DIR [options]" << std::endl;
                std::cout << "Options:" << std::endl;
                std::cout << "  --metric M        EUCLIDEAN, COSINE or DOT_PRODUCT (default: EUCLIDEAN)" << std::endl;
                std::cout << "  --batch-size N    Texts per embedding call (default: 32)" << std::endl;
                std::cout << "The embedding endpoint comes from EMBEDDING_URL / EMBEDDING_MODEL." << std::endl;
                return 0;
            }
        }
        if (input.empty() || output.empty()) {
            std::cerr << "--input and --output are required" << std::endl;
            return 2;
        }
        auto metric = moderag::parseMetric(metricName);
        if (!metric) {
            std::cerr << "Unknown metric: " << metricName << std::endl;
            return 2;
        }

        moderag::ServiceConfig config = moderag::ServiceConfig::fromEnvironment();
        moderag::applyLogLevel(config.log_level);

        auto transport = std::make_shared<moderag::CurlTransport>(config.http_pool_size);
        moderag::EmbeddingGateway embedder(transport, config.embedding, config.retryPolicy());
        auto index = moderag::buildIndexFile(embedder, input, output, *metric, batchSize);

        std::cout << "Built " << index->describe() << " in " << output << std::endl;
    } catch (const moderag::ModerationError& e) {
        std::cerr << "Error: " << e.what() << " (kind: " << moderag::toString(e.kind)
                  << ", attempts: " << e.attempts << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
