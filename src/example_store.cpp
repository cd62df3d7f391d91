#include "moderag/example_store.hpp"
#include "moderag/errors.hpp"

#include <fstream>

#include <spdlog/spdlog.h>

namespace moderag {

namespace {

bool reservedKey(const std::string& key) {
    return key == "text" || key == "category" || key == "moderation_category" ||
           key == "metadata" || key == "embedding";
}

} // namespace

ExampleStore::ExampleStore(std::vector<Example> examples)
    : examples_(std::move(examples)) {}

void ExampleStore::append(Example example) {
    examples_.push_back(std::move(example));
}

const Example& ExampleStore::at(size_t row) const {
    if (row >= examples_.size()) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT,
                              "example row " + std::to_string(row) + " out of range");
    }
    return examples_[row];
}

std::vector<std::string> ExampleStore::texts() const {
    std::vector<std::string> out;
    out.reserve(examples_.size());
    for (const auto& e : examples_) {
        out.push_back(e.text);
    }
    return out;
}

void ExampleStore::saveJsonl(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string() + " for writing");
    }
    for (const auto& example : examples_) {
        nlohmann::json j = example;
        file << j.dump() << '\n';
    }
    if (!file) {
        throw ModerationError(ErrorKind::IO, "write to " + path.string() + " failed");
    }
}

ExampleStore ExampleStore::loadJsonl(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ModerationError(ErrorKind::IO, "cannot open " + path.string());
    }

    ExampleStore store;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(file, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("text") || !j.at("text").is_string()) {
            throw ModerationError(ErrorKind::IO,
                                  path.string() + ":" + std::to_string(lineNo) + ": not a labeled example");
        }

        const char* labelKey = j.contains("category") ? "category" : "moderation_category";
        if (!j.contains(labelKey) || !j.at(labelKey).is_string() ||
            !CategoryTaxonomy::lookup(j.at(labelKey).get<std::string>())) {
            throw ModerationError(ErrorKind::INVALID_ARGUMENT,
                                  path.string() + ":" + std::to_string(lineNo) + ": missing or unknown category");
        }

        Example example;
        try {
            example = j.get<Example>();
        } catch (const nlohmann::json::exception& e) {
            throw ModerationError(ErrorKind::IO,
                                  path.string() + ":" + std::to_string(lineNo) + ": " + e.what());
        }
        if (!j.contains("metadata")) {
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (!reservedKey(it.key())) {
                    example.metadata[it.key()] = it.value();
                }
            }
        }
        store.append(std::move(example));
    }
    spdlog::info("Loaded {} examples from {}", store.size(), path.string());
    return store;
}

} // namespace moderag
