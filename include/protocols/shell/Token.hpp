#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace ms::shell {

enum class TokenType { Word, Flag };

struct Token {
    TokenType type;
    std::string text;
};

inline bool looks_negative_number(std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

inline void pushFlag(std::vector<Token>& out, std::string k) {
    if (!k.empty() && k[0] == '-') k.erase(k.begin());
    out.push_back({TokenType::Flag, std::move(k)});
}

inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Heuristic: decide if "-XYZ" is a bundle or "-X<value>".
// If tail contains obvious value chars (/, ., :, =), treat as glued value.
inline bool looks_glued_value(std::string_view tail) {
    return std::ranges::any_of(tail, [](char c) {
        return c == '/' || c == '.' || c == ':' || c == '=';
    });
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// argv is already split by the shell, so each argument is classified on its own.
inline std::vector<Token> tokenize(const std::vector<std::string>& args) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    bool stop_flags = false;
    for (const auto& arg : args) {
        if (stop_flags || arg.empty() || arg == "-" || arg[0] != '-' || looks_negative_number(arg)) {
            pushWord(out, arg);
            continue;
        }

        if (arg == "--") {
            pushWord(out, "--");
            stop_flags = true;
            continue;
        }

        // Long flag forms: --key or --key=value
        if (arg.rfind("--", 0) == 0) {
            if (out.empty()) {
                // First token: allow it to be a command ("--help", "--version")
                pushWord(out, arg);
                continue;
            }
            const auto eq = arg.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, arg.substr(2));
            } else {
                pushFlag(out, arg.substr(2, eq - 2));
                pushWord(out, arg.substr(eq + 1));
            }
            continue;
        }

        // Short flag(s)
        if (arg.size() == 2) {
            if (out.empty()) pushWord(out, arg);
            else pushFlag(out, arg.substr(1));
            continue;
        }

        const std::string_view tail = std::string_view(arg).substr(2);
        if (looks_glued_value(tail)) {
            pushFlag(out, std::string(1, arg[1]));
            std::string value(tail);
            if (!value.empty() && value[0] == '=') value.erase(value.begin());
            pushWord(out, std::move(value));
        } else {
            expand_bundle(std::string_view(arg).substr(1), out);
        }
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    }
    return "UnknownToken";
}

inline std::string to_string(const std::vector<Token>& tokens) {
    std::string out;
    out.reserve(64 + tokens.size() * 16);
    for (const auto& t : tokens) {
        if (!out.empty()) out += " ";
        out += to_string(t);
    }
    return out;
}

}
