#pragma once

#include "sync/model/Policy.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ms::config { struct Config; }

namespace ms::progress { class Sink; }
namespace ms::storage { class Client; struct Location; }

namespace ms::sync {

class Session;

struct MirrorRequest {
    std::string source;
    std::vector<std::string> targets;
    model::Policy policy;
    std::optional<unsigned int> workers{};
};

// Wires one mirror run together: producers, executor, status reducer and
// the session, all stopping on the shared interrupt flag.
class Controller {
public:
    static constexpr int EXIT_OK = 0;
    static constexpr int EXIT_FAILED = 1;
    static constexpr int EXIT_INTERRUPTED = 130;

    // Opens a client for a resolved location. Defaults to the Resolver.
    using Connector = std::function<std::shared_ptr<storage::Client>(const storage::Location&)>;

    Controller(const config::Config& config, std::atomic<bool>& interrupt, Connector connect = {});

    // Returns the process exit code. Argument and policy errors throw
    // std::invalid_argument, fatal errors any other std::exception.
    int run(const MirrorRequest& request, progress::Sink& sink);

private:
    const config::Config& config_;
    std::atomic<bool>& interrupt_;
    Connector connect_;

    std::unique_ptr<Session> openSession(const MirrorRequest& request, progress::Sink& sink) const;
};

}
