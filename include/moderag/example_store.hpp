#pragma once

#include <filesystem>
#include <vector>

#include "moderag/models.hpp"

namespace moderag {

// Append-only sequence of labeled examples. Row i lines up with vector i of
// the index it is paired with.
class ExampleStore {
public:
    ExampleStore() = default;
    explicit ExampleStore(std::vector<Example> examples);

    void append(Example example);

    const Example& at(size_t row) const;
    size_t size() const { return examples_.size(); }
    bool empty() const { return examples_.empty(); }
    const std::vector<Example>& examples() const { return examples_; }
    std::vector<std::string> texts() const;

    // One JSON object per line, in row order.
    void saveJsonl(const std::filesystem::path& path) const;

    // Accepts both the persisted layout and raw labeled corpora
    // ({"text", "moderation_category", ...extra fields}); extra fields are
    // kept as metadata. Unknown labels are rejected.
    static ExampleStore loadJsonl(const std::filesystem::path& path);

private:
    std::vector<Example> examples_;
};

} // namespace moderag
