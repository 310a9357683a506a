#pragma once

#include "cli/types.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cw::cli {

class Router {
public:
    void registerCommand(const std::string& name, CommandInfo info);

    CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] std::string renderHelp() const;
    [[nodiscard]] std::unordered_set<std::string> switches() const { return switches_; }

    // Flags that never take a value (e.g. --dry-run).
    void registerSwitch(const std::string& key) { switches_.insert(key); }

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    std::vector<std::string> order_;
    std::unordered_set<std::string> switches_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
};

}
