#include "moderag/taxonomy.hpp"

#include <algorithm>
#include <cctype>

namespace moderag {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const std::vector<Category>& CategoryTaxonomy::all() {
    static const std::vector<Category> categories = {
        Category::HATE_OR_DISCRIMINATION,
        Category::VIOLENCE_OR_THREATS,
        Category::OFFENSIVE_LANGUAGE,
        Category::NSFW_CONTENT,
        Category::SPAM_OR_SCAMS,
        Category::CLEAN,
    };
    return categories;
}

const char* CategoryTaxonomy::name(Category category) {
    switch (category) {
        case Category::HATE_OR_DISCRIMINATION: return "hate_or_discrimination";
        case Category::VIOLENCE_OR_THREATS: return "violence_or_threats";
        case Category::OFFENSIVE_LANGUAGE: return "offensive_language";
        case Category::NSFW_CONTENT: return "nsfw_content";
        case Category::SPAM_OR_SCAMS: return "spam_or_scams";
        case Category::CLEAN: return "clean";
    }
    return "clean";
}

std::optional<Category> CategoryTaxonomy::lookup(std::string_view token) {
    const auto& categories = all();
    auto it = std::find_if(categories.begin(), categories.end(), [&](Category c) {
        return equalsIgnoreCase(token, name(c));
    });
    if (it == categories.end()) {
        return std::nullopt;
    }
    return *it;
}

Category CategoryTaxonomy::validate(std::string_view candidate, bool* matched) {
    auto category = lookup(candidate);
    if (matched) {
        *matched = category.has_value();
    }
    return category.value_or(fallback());
}

std::string toString(Category category) {
    return CategoryTaxonomy::name(category);
}

} // namespace moderag
