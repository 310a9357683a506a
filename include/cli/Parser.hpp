#pragma once

#include "cli/types.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace cw::cli {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline bool looksNegativeNumber(const std::string& s) {
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

inline bool isFlagToken(const std::string& s) {
    return s.size() > 1 && s[0] == '-' && s != "--" && !looksNegativeNumber(s);
}

// argv[1..] -> CommandCall. "--key value", "--key=value" and "-k value" set options;
// keys listed in switches never consume the next word. "--" ends flag parsing.
inline CommandCall parseArgs(const std::vector<std::string>& args,
                             const std::unordered_set<std::string>& switches = {}) {
    CommandCall call;
    call.options.reserve(8);
    call.positionals.reserve(8);

    size_t i = 0;

    // 1) Command name = first word; a leading flag (help-style) stands in for it
    if (!args.empty()) {
        call.name = args[0];
        i = 1;
    }

    bool stopFlags = false;

    for (; i < args.size(); ++i) {
        const auto& t = args[i];

        if (!stopFlags && t == "--") {
            stopFlags = true;
            continue;
        }

        if (!stopFlags && isFlagToken(t)) {
            auto key = t.substr(t.starts_with("--") ? 2 : 1);
            if (const auto eq = key.find('='); eq != std::string::npos) {
                setOpt(call, key.substr(0, eq), key.substr(eq + 1));
                continue;
            }
            if (!switches.contains(key) && i + 1 < args.size() && !isFlagToken(args[i + 1]) && args[i + 1] != "--") {
                setOpt(call, key, args[i + 1]);
                ++i; // consumed value
            } else {
                setOpt(call, key, std::nullopt);
            }
            continue;
        }

        // Positional (either after "--" or just a word)
        call.positionals.push_back(t);
    }

    return call;
}

}
