#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "log/Registry.hpp"

#include <cctype>
#include <fmt/core.h>

using namespace cw::cli;
using namespace cw::log;

void Router::registerCommand(const std::string& name, CommandInfo info) {
    const auto key = normalize(name);
    if (info.description.empty()) info.description = "No description provided.";

    for (const auto& alias : info.aliases) {
        const auto a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            Registry::chunkwise()->warn("[Router] Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                        a, aliasMap_.at(a), key);
            continue;
        }
        aliasMap_[a] = key;
    }

    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const auto n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

CommandResult Router::execute(const CommandCall& call) const {
    if (call.name.empty() || call.name == "help" || call.name == "--help" || call.name == "-h")
        return ok(renderHelp());

    const auto canonical = canonicalFor(call.name);
    if (!commands_.contains(canonical))
        return {2, renderHelp(), fmt::format("Unknown command: {}", call.name)};

    Registry::chunkwise()->debug("[Router] Executing command: '{}'", canonical);
    return commands_.at(canonical).handler(call);
}

std::string Router::renderHelp() const {
    std::string out = "usage: chunkwise <command> [options]\n\ncommands:\n";
    for (const auto& name : order_) {
        const auto& info = commands_.at(name);
        out += fmt::format("  {:<10} {}\n", name, info.description);
        if (!info.usage.empty()) out += fmt::format("  {:<10}   {}\n", "", info.usage);
    }
    return out;
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    // strip leading dashes so "--plan" and "plan" resolve alike
    const auto first = out.find_first_not_of('-');
    return first == std::string::npos ? out : out.substr(first);
}
