#include "moderag/prompt_assembler.hpp"
#include "moderag/errors.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace moderag {

namespace {

size_t sequenceLength(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

PromptTemplate PromptTemplate::defaults() {
    PromptTemplate t;
    t.system_prompt =
        "You are a content moderation expert. Your task is to analyze content "
        "and categorize it into one of the following categories:\n\n"
        "1. hate_or_discrimination: Content targeting protected characteristics with negative intent/prejudice\n"
        "2. violence_or_threats: Content that threatens, depicts, or promotes violence\n"
        "3. offensive_language: Hostile or inappropriate content WITHOUT targeting protected characteristics\n"
        "4. nsfw_content: Explicit sexual content or material intended to arouse\n"
        "5. spam_or_scams: Deceptive or unsolicited content designed to mislead\n"
        "6. clean: Content that is allowed and doesn't fall into above categories\n\n"
        "Please format your response exactly as:\n"
        "Category: [exact category_name]\n"
        "Confidence: [HIGH/MEDIUM/LOW]\n"
        "Explanation: [short 1/2 line explanation]";
    t.user_template =
        "Here are some example classifications:\n\n"
        "{examples}"
        "Now, please classify this text:\n"
        "{query}";
    t.example_template =
        "Text: {text}\n"
        "Category: {category}\n\n";
    return t;
}

std::string truncateUtf8(const std::string& text, size_t maxCodePoints) {
    size_t pos = 0;
    size_t count = 0;
    while (pos < text.size() && count < maxCodePoints) {
        size_t len = sequenceLength(static_cast<unsigned char>(text[pos]));
        if (pos + len > text.size()) {
            // incomplete trailing sequence
            break;
        }
        for (size_t i = 1; i < len; ++i) {
            if (!isContinuation(static_cast<unsigned char>(text[pos + i]))) {
                len = 1;
                break;
            }
        }
        pos += len;
        ++count;
    }
    return text.substr(0, pos);
}

PromptAssembler::PromptAssembler(PromptTemplate tmpl)
    : template_(std::move(tmpl)) {
    if (template_.user_template.find("{query}") == std::string::npos) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, "user prompt template has no {query} placeholder");
    }
    try {
        renderExample(1, RetrievedExample{"sample", Category::CLEAN, 0.5f});
        (void)fmt::format(fmt::runtime(template_.user_template),
                          fmt::arg("examples", ""), fmt::arg("query", "sample"));
    } catch (const fmt::format_error& e) {
        throw ModerationError(ErrorKind::INVALID_ARGUMENT, std::string("invalid prompt template: ") + e.what());
    }
}

std::string PromptAssembler::renderExample(size_t index, const RetrievedExample& example) const {
    return fmt::format(fmt::runtime(template_.example_template),
                       fmt::arg("index", index),
                       fmt::arg("text", example.text),
                       fmt::arg("category", toString(example.category)),
                       fmt::arg("distance", example.distance),
                       fmt::arg("similarity", 1.0f - example.distance));
}

AssembledPrompt PromptAssembler::assemble(const std::string& query,
                                          std::vector<RetrievedExample> examples,
                                          int maxExamples,
                                          size_t maxTextLength) const {
    std::stable_sort(examples.begin(), examples.end(),
                     [](const RetrievedExample& a, const RetrievedExample& b) { return a.distance < b.distance; });
    const size_t cap = static_cast<size_t>(std::max(0, maxExamples));
    if (examples.size() > cap) {
        examples.resize(cap);
    }

    std::string rendered;
    for (size_t i = 0; i < examples.size(); ++i) {
        examples[i].text = truncateUtf8(examples[i].text, maxTextLength);
        rendered += renderExample(i + 1, examples[i]);
    }

    AssembledPrompt prompt;
    prompt.system = template_.system_prompt;
    prompt.user = fmt::format(fmt::runtime(template_.user_template),
                              fmt::arg("examples", rendered),
                              fmt::arg("query", truncateUtf8(query, maxTextLength)));
    prompt.examples = std::move(examples);
    return prompt;
}

} // namespace moderag
