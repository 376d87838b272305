#ifndef TRIAGEGUARD_CORE_PLACEHOLDER_SYNTAX_HPP
#define TRIAGEGUARD_CORE_PLACEHOLDER_SYNTAX_HPP

#include <string>
#include <vector>
#include <regex>
#include "types.hpp"

/**
 * @file placeholder_syntax.hpp
 * @brief Wire syntax of placeholders: <<TYPE_tag>>, TYPE upper-case, tag lowercase hex.
 *
 * Protected regions (placeholders and the redaction literal) are never
 * re-recognized as raw content.
 */

namespace triageguard {
namespace core {

struct PlaceholderToken
{
    size_t start = 0;
    size_t end = 0;
    std::string token;
    std::string typeTag;
};

inline const std::regex &PlaceholderPattern()
{
    static const std::regex pattern(R"(<<([A-Z]+)_([0-9a-f]{8,64})>>)");
    return pattern;
}

inline std::string FormatPlaceholder(EntityType type, const std::string &tag)
{
    return "<<" + EntityTypeTag(type) + "_" + tag + ">>";
}

inline bool IsPlaceholder(const std::string &text)
{
    return std::regex_match(text, PlaceholderPattern());
}

inline std::vector<PlaceholderToken> FindPlaceholders(const std::string &text)
{
    std::vector<PlaceholderToken> found;
    if (text.find("<<") == std::string::npos) {
        return found;
    }
    auto begin = std::sregex_iterator(text.begin(), text.end(), PlaceholderPattern());
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        PlaceholderToken tok;
        tok.start = static_cast<size_t>(it->position(0));
        tok.end = tok.start + static_cast<size_t>(it->length(0));
        tok.token = it->str(0);
        tok.typeTag = it->str(1);
        found.push_back(tok);
    }
    return found;
}

/**
 * @brief Byte ranges [start, end) that must not be scanned: placeholders and redaction literals.
 */
inline std::vector<std::pair<size_t, size_t>> ProtectedRegions(const std::string &text)
{
    std::vector<std::pair<size_t, size_t>> regions;
    for (const auto &tok : FindPlaceholders(text)) {
        regions.emplace_back(tok.start, tok.end);
    }
    const std::string &literal = RedactionLiteral();
    for (size_t pos = text.find(literal); pos != std::string::npos;
         pos = text.find(literal, pos + literal.size())) {
        regions.emplace_back(pos, pos + literal.size());
    }
    return regions;
}

} // namespace core
} // namespace triageguard

#endif // TRIAGEGUARD_CORE_PLACEHOLDER_SYNTAX_HPP
