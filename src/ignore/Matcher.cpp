#include "ignore/Matcher.hpp"
#include "error/Exceptions.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <fmt/core.h>

using namespace ad::ignore;
using namespace ad::log;
using namespace ad::error;

Matcher::Matcher(std::vector<Rule> rules) : rules_(std::move(rules)) {}

void Matcher::parseInto(std::vector<Rule>& out, const std::vector<std::string>& lines, const std::string& origin) {
    size_t lineNo = 0;
    for (const auto& raw : lines) {
        ++lineNo;
        const auto line = ad::fs::model::trim(raw);
        if (line.empty() || line.front() == '#') continue;

        try {
            out.push_back(compile(line));
        } catch (const MalformedIgnoreRule& e) {
            throw MalformedIgnoreRule(line, fmt::format("{}:{}: {}", origin, lineNo, e.reason));
        }
    }
}

std::vector<std::string> Matcher::readLines(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) throw IOError("Failed to open ignore file: " + file.string());

    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);) lines.push_back(std::move(line));
    if (in.bad()) throw IOError("Failed to read ignore file: " + file.string());
    return lines;
}

Matcher Matcher::fromLines(const std::vector<std::string>& lines, const std::string& origin) {
    std::vector<Rule> rules;
    parseInto(rules, lines, origin);
    return Matcher(std::move(rules));
}

Matcher Matcher::fromSource(const std::filesystem::path& source) {
    namespace sfs = std::filesystem;

    std::error_code ec;
    const auto st = sfs::status(source, ec);
    if (ec || !sfs::exists(st)) {
        Registry::ignore()->debug("[Matcher] No ignore rules at {}", source.string());
        return {};
    }

    std::vector<sfs::path> files;
    if (sfs::is_directory(st)) {
        for (sfs::directory_iterator it(source, ec); !ec && it != sfs::directory_iterator(); it.increment(ec))
            if (std::error_code fec; it->is_regular_file(fec)) files.push_back(it->path());
        if (ec) throw IOError(fmt::format("Failed to list ignore directory {}: {}", source.string(), ec.message()));
        std::ranges::sort(files);
    } else {
        files.push_back(source);
    }

    std::vector<Rule> rules;
    for (const auto& f : files) parseInto(rules, readLines(f), f.string());

    Registry::ignore()->debug("[Matcher] Compiled {} rules from {} file(s) under {}", rules.size(), files.size(), source.string());
    return Matcher(std::move(rules));
}

Matcher Matcher::extend(const std::vector<std::string>& lines, const std::string& origin) const {
    auto rules = rules_;
    parseInto(rules, lines, origin);
    return Matcher(std::move(rules));
}

bool Matcher::matches(const std::string_view path) const {
    return std::ranges::any_of(rules_, [path](const Rule& r) { return ad::ignore::matches(r, path); });
}
