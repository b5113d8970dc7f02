#include "ignore/Rule.hpp"
#include "error/Exceptions.hpp"

#include <type_traits>

namespace ad::ignore {

static bool isRegexSpecial(const char c) {
    switch (c) {
    case '.': case '^': case '$': case '|': case '(': case ')':
    case '{': case '}': case '+': case '*': case '?': case '[':
    case ']': case '\\':
        return true;
    default:
        return false;
    }
}

static void appendLiteral(std::string& out, const char c) {
    if (isRegexSpecial(c)) out.push_back('\\');
    out.push_back(c);
}

// Inside a bracket expression only these are special.
static void appendClassLiteral(std::string& out, const char c) {
    if (c == '\\' || c == ']' || c == '[' || c == '^' || c == '-') out.push_back('\\');
    out.push_back(c);
}

std::string globToRegex(const std::string& glob) {
    std::string out;
    out.reserve(glob.size() * 2);

    for (size_t i = 0; i < glob.size(); ++i) {
        const char c = glob[i];

        if (c == '*') {
            while (i + 1 < glob.size() && glob[i + 1] == '*') ++i;   // "**" is the same as "*"
            out += "[\\s\\S]*";
            continue;
        }

        if (c == '?') {
            out += "[\\s\\S]";
            continue;
        }

        if (c == '\\') {
            if (i + 1 >= glob.size()) throw error::MalformedIgnoreRule(glob, "trailing escape character");
            appendLiteral(out, glob[++i]);
            continue;
        }

        if (c == '[') {
            size_t j = i + 1;
            std::string cls = "[";

            if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
                cls.push_back('^');
                ++j;
            }

            const size_t first = j;
            bool closed = false;
            for (; j < glob.size(); ++j) {
                const char k = glob[j];
                if (k == ']' && j > first) {
                    closed = true;
                    break;
                }
                if (k == '\\') {
                    if (j + 1 >= glob.size()) throw error::MalformedIgnoreRule(glob, "trailing escape character");
                    appendClassLiteral(cls, glob[++j]);
                    continue;
                }
                if (k == '-' && j > first && j + 1 < glob.size() && glob[j + 1] != ']') {
                    const char lo = glob[j - 1], hi = glob[j + 1];
                    if (lo > hi)
                        throw error::MalformedIgnoreRule(glob, std::string("invalid character range ") + lo + "-" + hi);
                    cls += '-';
                    continue;
                }
                appendClassLiteral(cls, k);
            }

            if (!closed) throw error::MalformedIgnoreRule(glob, "unterminated character class");
            cls += ']';
            out += cls;
            i = j;
            continue;
        }

        appendLiteral(out, c);
    }

    return out;
}

Rule compile(const std::string& line) {
    if (line.empty()) throw error::MalformedIgnoreRule(line, "empty rule");

    if (!isGlob(line)) {
        std::string prefix = line;
        while (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
        return PrefixRule{std::move(prefix)};
    }

    try {
        return GlobRule{line, std::regex(globToRegex(line), std::regex::ECMAScript | std::regex::optimize)};
    } catch (const std::regex_error& e) {
        throw error::MalformedIgnoreRule(line, e.what());
    }
}

bool matches(const Rule& rule, const std::string_view path) {
    return std::visit([path](const auto& r) -> bool {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PrefixRule>) {
            if (r.prefix == "/") return !path.empty() && path.front() == '/';
            if (!path.starts_with(r.prefix)) return false;
            return path.size() == r.prefix.size() || path[r.prefix.size()] == '/';
        } else {
            return std::regex_match(path.begin(), path.end(), r.regex);
        }
    }, rule);
}

const std::string& text(const Rule& rule) {
    return std::visit([](const auto& r) -> const std::string& {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, PrefixRule>) return r.prefix;
        else return r.pattern;
    }, rule);
}

}
