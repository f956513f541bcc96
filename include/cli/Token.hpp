#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace ds::cli {

enum class TokenType { Word, Flag, Value };

struct Token {
    TokenType type;
    std::string text;

    [[nodiscard]] bool operator==(const Token& other) const = default;
};

inline void pushFlag(std::vector<Token>& out, std::string k) {
    out.push_back({TokenType::Flag, std::move(k)});
}
inline void pushWord(std::vector<Token>& out, std::string v) {
    out.push_back({TokenType::Word, std::move(v)});
}

// Expand short bundle "-abc" -> flags a,b,c
inline void expand_bundle(const std::string_view bundle, std::vector<Token>& out) {
    for (const char c : bundle) pushFlag(out, std::string(1, c));
}

// Number of arguments a flag consumes; 0 for switches and unknown flags.
using ArityLookup = std::function<std::size_t(const std::string&)>;

// argv is already split by the shell, so each argument is one atom:
//   --key / --key=value / -abc / - / -- / anything else
// Everything after "--" is a Word. When `arity` is given, a flag that takes
// values swallows the following arguments verbatim as Values, so "--adb-flag -d"
// keeps "-d" as the value.
inline std::vector<Token> tokenize(const std::vector<std::string>& args, const ArityLookup& arity = {}) {
    std::vector<Token> out;
    out.reserve(args.size() + 4);

    const auto takeValues = [&](const std::string& key, std::size_t given, std::size_t& i) {
        const std::size_t want = arity ? arity(key) : 0;
        for (; given < want && i + 1 < args.size(); ++given) out.push_back({TokenType::Value, args[++i]});
    };

    bool stop = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (stop || a.size() < 2 || a[0] != '-') {
            pushWord(out, a);
            continue;
        }

        if (a == "--") {
            pushWord(out, a);
            stop = true;
            continue;
        }

        // Long flag forms: --key or --key=value
        if (a.rfind("--", 0) == 0) {
            const auto eq = a.find('=');
            if (eq == std::string::npos) {
                pushFlag(out, a.substr(2));
                takeValues(a.substr(2), 0, i);
            } else {
                pushFlag(out, a.substr(2, eq - 2));
                out.push_back({TokenType::Value, a.substr(eq + 1)});
                takeValues(a.substr(2, eq - 2), 1, i);
            }
            continue;
        }

        expand_bundle(std::string_view(a).substr(1), out);
        takeValues(a.substr(a.size() - 1), 0, i);
    }

    return out;
}

inline std::string to_string(const Token& t) {
    switch (t.type) {
    case TokenType::Word: return "Word(" + t.text + ")";
    case TokenType::Flag: return "Flag(" + t.text + ")";
    case TokenType::Value: return "Value(" + t.text + ")";
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
