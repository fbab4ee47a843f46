#include "protocols/shell/commands/mirror.hpp"
#include "sync/Controller.hpp"
#include "sync/Interrupt.hpp"
#include "progress/Sink.hpp"
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <fmt/color.h>
#include <nlohmann/json.hpp>

using namespace ms::config;
using namespace ms::log;
using namespace ms::shell;
using namespace ms::sync;

namespace {

void reportFatal(const MirrorArgs& args, const std::string& what) {
    if (args.display.json) {
        std::cout << nlohmann::json{{"status", "error"}, {"error", {{"kind", "Fatal"}, {"message", what}}}}.dump()
                  << std::endl;
        return;
    }
    if (args.display.color) fmt::print(stderr, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "mirrorsync: <ERROR>");
    else fmt::print(stderr, "mirrorsync: <ERROR>");
    fmt::print(stderr, " {}\n", what);
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> rawArgs(argv + 1, argv + argc);
    auto invocation = parseCommandLine(rawArgs);

    if (const auto* result = std::get_if<CommandResult>(&invocation)) {
        if (!result->stdout_text.empty()) std::cout << result->stdout_text;
        if (!result->stderr_text.empty()) std::cerr << result->stderr_text << std::endl;
        return result->exit_code;
    }

    const auto& args = std::get<MirrorArgs>(invocation);

    try {
        ConfigRegistry::init(args.configPath);
        Registry::init(std::nullopt, args.display.debug);
    } catch (const std::exception& e) {
        reportFatal(args, fmt::format("initialization failed: {}", e.what()));
        return Controller::EXIT_FAILED;
    }

    interrupt::install();

    int code = Controller::EXIT_FAILED;
    try {
        const auto sink = ms::progress::makeSink(args.display);
        Controller controller(ConfigRegistry::get(), interrupt::flag());
        code = controller.run(args.request, *sink);
    } catch (const std::invalid_argument& e) {
        Registry::mirrorsync()->debug("[main] Rejected arguments: {}", e.what());
        reportFatal(args, e.what());
        code = Controller::EXIT_FAILED;
    } catch (const std::exception& e) {
        Registry::mirrorsync()->error("[main] Fatal: {}", e.what());
        if (args.display.json) reportFatal(args, e.what());
        code = Controller::EXIT_FAILED;
    }

    Registry::shutdown();
    return code;
}
