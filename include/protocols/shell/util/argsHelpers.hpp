#pragma once

#include "protocols/shell/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace ms::shell {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

std::optional<unsigned int> parseUInt(const std::string& sv);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasKey(const CommandCall& c, const std::string& key);

// First option key not in known, if any.
[[nodiscard]] std::optional<std::string> unknownOption(const CommandCall& c, const std::vector<std::string>& known);

}
