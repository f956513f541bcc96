#pragma once

#include "cli/Token.hpp"
#include "cli/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ds::cli {

inline void addOpt(CommandCall& c, const std::string& key, std::vector<std::string> args = {}) {
    c.options.push_back(FlagKV{key, std::move(args)});
}

// `canonical` maps a spelled flag ("t", "times", "del") to its option name and
// the number of arguments it takes; it returns nullopt for unknown flags.
struct FlagInfo {
    std::string name;
    std::size_t arity{0};
};
using FlagLookup = std::function<std::optional<FlagInfo>(const std::string&)>;

// Values come from Value tokens (see tokenize's arity hook) or, failing that,
// from the following Words.
inline CommandCall parseTokens(const std::vector<Token>& toks, const FlagLookup& canonical) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(4);

    bool stop_flags = false;

    for (std::size_t i = 0; i < toks.size(); ++i) {
        const Token& t = toks[i];

        // Sentinel: "--" arrives as a Word from the tokenizer
        if (!stop_flags && t.type == TokenType::Word && t.text == "--") {
            stop_flags = true;
            continue;
        }

        if (t.type == TokenType::Value) throw UsageError("Unexpected value '" + t.text + "'");

        if (!stop_flags && t.type == TokenType::Flag) {
            const auto spelled = t.text.size() == 1 ? "-" + t.text : "--" + t.text;
            const auto info = canonical(t.text);
            if (!info) throw UsageError("Unknown option " + spelled);

            const bool inlineValue = i + 1 < toks.size() && toks[i + 1].type == TokenType::Value;
            if (!info->arity) {
                if (inlineValue) throw UsageError("Option " + spelled + " does not take a value");
                addOpt(call, info->name);
                continue;
            }

            std::vector<std::string> args;
            while (args.size() < info->arity && i + 1 < toks.size()) {
                const auto& next = toks[i + 1];
                const bool word = next.type == TokenType::Word && next.text != "--";
                if (next.type != TokenType::Value && !word) break;
                args.push_back(next.text);
                ++i; // consumed value
            }
            if (args.size() < info->arity)
                throw UsageError("Option " + spelled + (info->arity == 1 ? " requires a value"
                                                                         : " requires " + std::to_string(info->arity) + " values"));
            addOpt(call, info->name, std::move(args));
            continue;
        }

        // Positional (either after "--" or just a Word)
        call.positionals.push_back(t.text);
    }

    return call;
}

}
