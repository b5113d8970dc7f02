#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <variant>

namespace ad::ignore {

// Matches the literal path and anything nested under it, on separator boundaries.
struct PrefixRule {
    std::string prefix;
};

// Wildcard pattern: '*' any run of characters ('/' included), '?' one character,
// '[...]' a character class ('!' or '^' negates), '\' escapes the next character.
struct GlobRule {
    std::string pattern;
    std::regex regex;
};

using Rule = std::variant<PrefixRule, GlobRule>;

// Lines containing any of "*?[" compile to a GlobRule, everything else to a PrefixRule.
// Throws error::MalformedIgnoreRule.
Rule compile(const std::string& line);

[[nodiscard]] bool matches(const Rule& rule, std::string_view path);

[[nodiscard]] const std::string& text(const Rule& rule);

[[nodiscard]] inline bool isGlob(const std::string_view line) {
    return line.find_first_of("*?[") != std::string_view::npos;
}

// Translates a glob into an anchored ECMAScript expression.
std::string globToRegex(const std::string& glob);

}
