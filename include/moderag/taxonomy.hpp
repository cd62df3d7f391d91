#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace moderag {

enum class Category {
    HATE_OR_DISCRIMINATION,
    VIOLENCE_OR_THREATS,
    OFFENSIVE_LANGUAGE,
    NSFW_CONTENT,
    SPAM_OR_SCAMS,
    CLEAN
};

// The closed label set. Order of all() is the priority order used when a
// caller asks for taxonomy-ordered tie-breaking.
class CategoryTaxonomy {
public:
    static constexpr Category fallback() { return Category::CLEAN; }
    static bool isClean(Category category) { return category == Category::CLEAN; }

    static const std::vector<Category>& all();
    static const char* name(Category category);

    // Case-insensitive exact match on the tag, e.g. "Spam_Or_Scams".
    static std::optional<Category> lookup(std::string_view token);

    // Total mapping: unknown tokens become fallback(). `matched` reports
    // whether the token was a member of the set.
    static Category validate(std::string_view candidate, bool* matched = nullptr);
};

std::string toString(Category category);

} // namespace moderag
