#include "moderag/config.hpp"
#include "moderag/errors.hpp"
#include "moderag/load_harness.hpp"
#include "moderag/service_client.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

std::vector<int> parseLevels(const std::string& value) {
    std::vector<int> levels;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        const int level = std::stoi(item);
        if (level < 1) {
            throw moderag::ModerationError(moderag::ErrorKind::INVALID_ARGUMENT,
                                           "concurrency levels must be positive: " + value);
        }
        levels.push_back(level);
    }
    if (levels.empty()) {
        throw moderag::ModerationError(moderag::ErrorKind::INVALID_ARGUMENT, "no concurrency level in: " + value);
    }
    return levels;
}

std::chrono::milliseconds seconds(double s) {
    return std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
}

void printUsage(const char* program) {
    std::cout << "moderag load tester" << std::endl;
    std::cout << "Usage: " << program << " --input-file FILE [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --server-url URL     Server to test (default: http://localhost:8080)" << std::endl;
    std::cout << "  --input-file FILE    JSONL corpus with text and optional moderation_category" << std::endl;
    std::cout << "  --concurrency N      Level, or comma-separated levels for a scaling sweep (default: 8)" << std::endl;
    std::cout << "  --duration S         Seconds per level (default: 60)" << std::endl;
    std::cout << "  --ramp-up S          Seconds to ramp from 1 to N workers (default: 0)" << std::endl;
    std::cout << "  --cooldown S         Seconds between sweep levels (default: 10)" << std::endl;
    std::cout << "  --num-samples N      Sample N corpus items (default: all)" << std::endl;
    std::cout << "  --stratified         Sample evenly across labels" << std::endl;
    std::cout << "  --num-examples N     Examples retrieved per request (default: 3)" << std::endl;
    std::cout << "  --rate R             Requests per second per worker (default: unpaced)" << std::endl;
    std::cout << "  --output-dir DIR     Where result files go (default: results)" << std::endl;
    std::cout << "  --api-key KEY        Sent as X-API-Key" << std::endl;
}

void printSummary(const moderag::LoadTestMetrics& m) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "concurrency=" << m.concurrency
              << "  rps=" << m.requests_per_second
              << "  avg=" << m.average_latency_ms << "ms"
              << "  p50=" << m.p50_latency_ms << "ms"
              << "  p95=" << m.p95_latency_ms << "ms"
              << "  p99=" << m.p99_latency_ms << "ms"
              << "  errors=" << m.error_rate * 100.0 << "%";
    if (m.accuracy) {
        std::cout << "  accuracy=" << *m.accuracy << "%";
    }
    std::cout << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    moderag::LoadTestConfig config;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--server-url" && i + 1 < argc) {
                config.server_url = argv[++i];
            } else if (arg == "--input-file" && i + 1 < argc) {
                config.input_file = argv[++i];
            } else if (arg == "--concurrency" && i + 1 < argc) {
                config.concurrency = parseLevels(argv[++i]);
            } else if (arg == "--duration" && i + 1 < argc) {
                config.duration_s = std::stod(argv[++i]);
            } else if (arg == "--ramp-up" && i + 1 < argc) {
                config.ramp_up_s = std::stod(argv[++i]);
            } else if (arg == "--cooldown" && i + 1 < argc) {
                config.cooldown_s = std::stod(argv[++i]);
            } else if (arg == "--num-samples" && i + 1 < argc) {
                config.num_samples = std::stoull(argv[++i]);
            } else if (arg == "--stratified") {
                config.stratified = true;
            } else if (arg == "--num-examples" && i + 1 < argc) {
                config.num_examples = std::stoi(argv[++i]);
            } else if (arg == "--rate" && i + 1 < argc) {
                config.rate = std::stod(argv[++i]);
            } else if (arg == "--output-dir" && i + 1 < argc) {
                config.output_dir = argv[++i];
            } else if (arg == "--api-key" && i + 1 < argc) {
                config.api_key = argv[++i];
            } else if (arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 2;
            }
        }
        if (config.input_file.empty()) {
            std::cerr << "--input-file is required" << std::endl;
            printUsage(argv[0]);
            return 2;
        }

        auto corpus = moderag::loadCorpus(config.input_file);
        if (config.num_samples > 0) {
            std::mt19937 rng(std::random_device{}());
            corpus = config.stratified ? moderag::sampleStratified(corpus, config.num_samples, rng)
                                       : moderag::sampleRandom(std::move(corpus), config.num_samples, rng);
        }

        moderag::ServiceClient client(config.server_url, config.api_key);
        auto health = client.healthCheck();
        spdlog::info("Server {} is {} (version {}, index size {})",
                     config.server_url, health.status, health.version, health.index_size);
        if (!health.index_loaded) {
            spdlog::warn("Server reports no index loaded; requests will fail");
        }

        moderag::LoadHarness harness(client, std::move(corpus));
        harness.setNumExamples(config.num_examples);

        if (config.concurrency.size() == 1) {
            auto metrics = harness.run(config.concurrency.front(), seconds(config.duration_s),
                                       seconds(config.ramp_up_s), config.rate);
            printSummary(metrics);
            moderag::saveMetrics(metrics, config.output_dir);
        } else {
            auto levels = harness.runScaling(
                config.concurrency, seconds(config.duration_s), seconds(config.cooldown_s),
                seconds(config.ramp_up_s), config.rate,
                [&config](const std::vector<moderag::LoadTestMetrics>& sofar) {
                    moderag::saveScalingReport(sofar, config.output_dir);
                });
            std::cout << "\nScaling results" << std::endl;
            for (const auto& m : levels) {
                printSummary(m);
            }
            if (auto best = moderag::bestLevel(levels)) {
                std::cout << "Best concurrency: " << levels[*best].concurrency << std::endl;
            } else {
                std::cout << "No level stayed under a 5% error rate" << std::endl;
            }
        }
    } catch (const moderag::ModerationError& e) {
        std::cerr << "Error: " << e.what() << " (kind: " << moderag::toString(e.kind)
                  << ", status: " << e.status_code << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
