#include "protocols/shell/commands/mirror.hpp"
#include "protocols/shell/Parser.hpp"
#include "protocols/shell/Token.hpp"
#include "protocols/shell/util/argsHelpers.hpp"

#include <stdexcept>
#include <unistd.h>
#include <fmt/format.h>

namespace ms::shell {

namespace {

const std::unordered_set<std::string> VALUE_FLAGS{"config", "workers"};

const std::vector<std::string> MIRROR_FLAGS{
    "force", "fake", "dry-run", "watch", "w", "remove", "json", "quiet", "q", "debug", "no-color",
    "workers", "config", "help", "h"
};

}

std::string usageText() {
    return
        "Usage:\n"
        "  mirrorsync mirror [FLAGS] SOURCE TARGET [TARGET...]\n"
        "  mirrorsync help | --help | -h\n"
        "  mirrorsync version | --version\n"
        "\n"
        "Mirror SOURCE into every TARGET. A location is a local path, or alias/bucket/prefix\n"
        "for an alias defined in the config file.\n"
        "\n"
        "Flags:\n"
        "  --force            overwrite targets whose size differs\n"
        "  --fake, --dry-run  plan and report without touching storage\n"
        "  --watch, -w        keep mirroring changes until interrupted\n"
        "  --remove           delete target objects missing from the source (needs --force)\n"
        "  --json             one JSON record per line on stdout\n"
        "  --quiet, -q        print errors only\n"
        "  --debug            verbose logging on stderr\n"
        "  --no-color         disable colored output\n"
        "  --workers N        concurrent transfers (default from config)\n"
        "  --config PATH      config file (default $MIRRORSYNC_CONFIG or ~/.mirrorsync/config.yaml)\n";
}

Invocation parseMirror(const CommandCall& call) {
    if (hasFlag(call, std::vector<std::string>{"help", "h"})) return ok(usageText());

    if (const auto bad = unknownOption(call, MIRROR_FLAGS))
        return invalid(fmt::format("mirrorsync: unknown flag '{}'\n\n{}", *bad, usageText()));

    MirrorArgs args;
    auto& req = args.request;

    req.policy.force = hasKey(call, "force");
    req.policy.fake = hasKey(call, "fake") || hasKey(call, "dry-run");
    req.policy.watch = hasKey(call, "watch") || hasKey(call, "w");
    req.policy.remove = hasKey(call, "remove");

    args.display.json = hasKey(call, "json");
    args.display.quiet = hasKey(call, "quiet") || hasKey(call, "q");
    args.display.debug = hasKey(call, "debug");
    args.display.color = !hasKey(call, "no-color") && !args.display.json && isatty(STDERR_FILENO) == 1;

    if (hasKey(call, "workers")) {
        const auto raw = optVal(call, "workers").value_or("");
        const auto n = parseUInt(raw);
        if (!n || *n == 0) return invalid(fmt::format("mirrorsync: --workers needs a positive number, got '{}'", raw));
        req.workers = *n;
    }

    if (hasKey(call, "config")) {
        const auto path = optVal(call, "config").value_or("");
        if (path.empty()) return invalid("mirrorsync: --config needs a path");
        args.configPath = config::expandHome(path);
    }

    if (call.positionals.size() < 2)
        return invalid(fmt::format("mirrorsync: mirror needs a SOURCE and at least one TARGET\n\n{}", usageText()));

    try {
        req.policy.validate();
    } catch (const std::invalid_argument& e) {
        return invalid(fmt::format("mirrorsync: {}", e.what()));
    }

    req.source = call.positionals.front();
    req.targets.assign(call.positionals.begin() + 1, call.positionals.end());
    return args;
}

Invocation parseCommandLine(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args), VALUE_FLAGS);

    if (call.name.empty()) return invalid(usageText());
    if (call.name == "help" || call.name == "--help" || call.name == "-h") return ok(usageText());
    if (call.name == "version" || call.name == "--version") return ok(fmt::format("mirrorsync {}\n", MIRRORSYNC_VERSION));
    if (call.name == "mirror") return parseMirror(call);

    return invalid(fmt::format("mirrorsync: unknown command '{}'\n\n{}", call.name, usageText()));
}

}
