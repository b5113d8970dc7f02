#pragma once

#include "ignore/Rule.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ad::ignore {

// Ordered, immutable rule set. Rules are compiled once at construction;
// evaluation stops at the first rule that matches.
class Matcher {
public:
    Matcher() = default;
    explicit Matcher(std::vector<Rule> rules);

    // One rule per line; blank lines and lines starting with '#' are skipped.
    static Matcher fromLines(const std::vector<std::string>& lines, const std::string& origin = "<inline>");

    // A rule file, or a directory whose regular files are read in filename order.
    // A source that does not exist yields an empty matcher.
    static Matcher fromSource(const std::filesystem::path& source);

    // New matcher with the given rules appended after this one's.
    [[nodiscard]] Matcher extend(const std::vector<std::string>& lines, const std::string& origin = "<inline>") const;

    [[nodiscard]] bool matches(std::string_view path) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }
    [[nodiscard]] size_t size() const { return rules_.size(); }
    [[nodiscard]] bool empty() const { return rules_.empty(); }

private:
    std::vector<Rule> rules_;

    static void parseInto(std::vector<Rule>& out, const std::vector<std::string>& lines, const std::string& origin);
    static std::vector<std::string> readLines(const std::filesystem::path& file);
};

}
