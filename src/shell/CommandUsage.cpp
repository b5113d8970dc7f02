#include "shell/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>

namespace ad::shell {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0, n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        // hard break at newline
        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string keyOf(const Entry& it) {
    return it.aliases.empty() ? it.label : fmt::format("{} | {}", it.label, fmt::join(it.aliases, " | "));
}

std::size_t computeKeyWidth(const std::vector<Entry>& items, std::size_t cap) {
    std::size_t w = 0;
    for (const auto& it : items) w = std::max(w, keyOf(it).size());
    return std::min(w, cap);
}

std::string padRight(const std::string& s, std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       std::size_t indent, std::size_t gap, int width, std::size_t max_key_col) {
    if (items.empty()) return;
    out << title << "\n";

    const auto keyw = computeKeyWidth(items, max_key_col);
    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto desc_lines = wrap(it.desc, std::max(20, rightw));
        out << std::string(indent, ' ') << padRight(keyOf(it), keyw) << std::string(gap, ' ') << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

}

std::string stripDashes(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && s[i] == '-') ++i;
    return s.substr(i);
}

std::string CommandUsage::normalizePositional_(const std::string& s) {
    // If caller already used <> or [] leave it; else wrap as <name>
    if (s.find('<') != std::string::npos || s.find('[') != std::string::npos) return s;
    return "<" + s + ">";
}

std::string CommandUsage::buildSynopsis_() const {
    std::string out = "archdiff " + command;
    for (const auto& p : positionals) out += " " + normalizePositional_(p.label);
    for (const auto& o : optional) out += " [" + o.label + "]";
    return out;
}

std::vector<std::string> CommandUsage::flagKeys() const {
    std::vector<std::string> keys;
    for (const auto& o : optional) {
        keys.push_back(stripDashes(o.label));
        for (const auto& a : o.aliases) keys.push_back(stripDashes(a));
    }
    return keys;
}

std::string CommandUsage::basicStr() const {
    return fmt::format("  {:<10} {}", command, description);
}

std::string CommandUsage::toText() const {
    std::ostringstream out;
    out << "Usage: " << synopsis.value_or(buildSynopsis_()) << "\n\n";
    for (const auto& ln : wrap(description, term_width - 2)) out << "  " << ln << "\n";
    out << "\n";

    emitTwoColSection(out, "Arguments:", positionals, 2, 3, term_width, max_key_col);
    emitTwoColSection(out, "Options:", optional, 2, 3, term_width, max_key_col);

    if (!examples.empty()) {
        out << "Examples:\n";
        for (const auto& ex : examples) {
            out << "  " << ex.cmd << "\n";
            if (!ex.note.empty()) out << "      " << ex.note << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string CommandBook::toText() const {
    std::ostringstream out;
    out << title << "\n\n";
    out << "Usage: archdiff [options] <command> [args]\n\n";

    out << "Commands:\n";
    for (const auto& c : commands) out << c.basicStr() << "\n";
    out << "\n";

    emitTwoColSection(out, "Global options:", global, 2, 3, 100, 30);
    out << "Run 'archdiff help <command>' for details on a command.\n";
    return out.str();
}

}
