#pragma once

#include <string>
#include <vector>

#include "moderag/models.hpp"

namespace moderag {

// Templates use fmt named placeholders.
//   user_template:    {examples} {query}
//   example_template: {index} {text} {category} {distance} {similarity}
// {similarity} renders as 1 - distance.
struct PromptTemplate {
    std::string system_prompt;
    std::string user_template;
    std::string example_template;

    static PromptTemplate defaults();
};

struct AssembledPrompt {
    std::string system;
    std::string user;
    std::vector<RetrievedExample> examples;
};

// Cuts after at most maxCodePoints UTF-8 code points; never splits a
// multi-byte sequence. Invalid lead bytes count as one code point each.
std::string truncateUtf8(const std::string& text, size_t maxCodePoints);

class PromptAssembler {
public:
    // Throws ModerationError(INVALID_ARGUMENT) when a template does not render.
    explicit PromptAssembler(PromptTemplate tmpl = PromptTemplate::defaults());

    // Examples are ordered nearest first (stable on equal distance), capped at
    // maxExamples, and each text, like the query, is cut to maxTextLength.
    AssembledPrompt assemble(const std::string& query,
                             std::vector<RetrievedExample> examples,
                             int maxExamples,
                             size_t maxTextLength) const;

    const PromptTemplate& promptTemplate() const { return template_; }

private:
    PromptTemplate template_;

    std::string renderExample(size_t index, const RetrievedExample& example) const;
};

} // namespace moderag
