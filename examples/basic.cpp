#include "moderag/errors.hpp"
#include "moderag/service_client.hpp"
#include <iostream>
#include <vector>
#include <string>

int main() {
    try {
        moderag::ServiceClient client("localhost", 8080);

        auto health = client.healthCheck();
        std::cout << "Health check: " << health.status << std::endl;
        std::cout << "Index loaded: " << (health.index_loaded ? "yes" : "no")
                  << " (" << health.index_size << " examples)" << std::endl;

        std::vector<std::string> texts = {
            "Have a wonderful weekend, see you Monday!",
            "I will find you and make you pay for this",
            "Click here to claim your free prize, limited offer",
        };

        for (const auto& text : texts) {
            moderag::ClassificationRequest request;
            request.text = text;
            request.num_examples = 3;

            auto result = client.classify(request);
            std::cout << "Text: " << result.query << std::endl;
            std::cout << "  Category: " << moderag::toString(result.category)
                      << ", Confidence: " << result.confidence
                      << ", Outcome: " << moderag::toString(result.outcome) << std::endl;
            for (const auto& example : result.similar_examples) {
                std::cout << "  - " << moderag::toString(example.category)
                          << " (distance " << example.distance << "): " << example.text << std::endl;
            }
            std::cout << "  Total latency: " << result.totalLatencyMs() << "ms" << std::endl;
        }

    } catch (const moderag::ClassificationError& e) {
        std::cerr << "Classification failed at " << moderag::toString(e.stage) << ": " << e.what()
                  << " (Status: " << e.status_code << ")" << std::endl;
        return 1;
    } catch (const moderag::ModerationError& e) {
        std::cerr << "API Error: " << e.what() << " (Status: " << e.status_code << ")" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
