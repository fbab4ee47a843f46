#pragma once

#include "protocols/shell/Token.hpp"
#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace ms::shell {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

// Only flags named in valueFlags consume the following word; every other
// flag is a switch, so "--force SRC DST" keeps SRC positional.
inline CommandCall parseTokens(const std::vector<Token>& toks,
                               const std::unordered_set<std::string>& valueFlags = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // 1) Command name = first Word
    if (!toks.empty() && toks[0].type == TokenType::Word) {
        call.name = toks[0].text;
        i = 1;
    }

    bool stop_flags = false;

    for (; i < toks.size(); ++i) {
        const Token& t = toks[i];

        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && t.type == TokenType::Flag) {
            if (valueFlags.contains(t.text) && i + 1 < toks.size() && toks[i + 1].type == TokenType::Word) {
                setOpt(call, t.text, toks[i + 1].text);
                ++i; // consumed value
            } else {
                setOpt(call, t.text, std::nullopt);
            }
            continue;
        }

        call.positionals.push_back(t.text);
    }

    return call;
}

}
