#pragma once

#include "cli/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cw::cli {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
// First of several spellings that is present, e.g. {"parallel", "j"}.
std::optional<std::string> optValAny(const CommandCall& c, const std::vector<std::string>& keys);

std::optional<unsigned int> parseUInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasAnyFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// "a,b,,c" -> {"a", "b", "c"}
std::vector<std::string> splitList(const std::string& s, char sep = ',');

}
