#pragma once

#include "shell/Token.hpp"
#include "shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ad::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c,
                   const std::string& key,
                   const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Flags may appear anywhere on the line. Only flags listed in valueFlags consume
// the following Word; every other flag is boolean.
inline CommandCall parseTokens(const std::vector<Token>& toks, const std::unordered_set<std::string>& valueFlags = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    bool stop_flags = false;

    for (size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto& key = t.text;
            if (valueFlags.contains(key) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, key, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        // Command name = first Word, the rest are positionals
        if (call.name.empty()) call.name = t.text;
        else call.positionals.push_back(t.text);
    }

    return call;
}

}
