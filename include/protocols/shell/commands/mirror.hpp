#pragma once

#include "protocols/shell/types.hpp"
#include "sync/Controller.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#ifndef MIRRORSYNC_VERSION
#define MIRRORSYNC_VERSION "0.1.0"
#endif

namespace ms::shell {

struct MirrorArgs {
    sync::MirrorRequest request;
    config::DisplayConfig display;
    std::optional<std::filesystem::path> configPath{};
};

// Either a mirror run to perform, or a finished result (help, version, usage error).
using Invocation = std::variant<MirrorArgs, CommandResult>;

// args excludes argv[0].
Invocation parseCommandLine(const std::vector<std::string>& args);

Invocation parseMirror(const CommandCall& call);

std::string usageText();

}
