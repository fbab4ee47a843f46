#pragma once

#include "storage/Location.hpp"

#include <memory>
#include <string>

namespace ms::config { struct Config; }

namespace ms::storage {

class Client;

// Maps command-line URLs onto locations and clients. "alias/bucket/prefix" is
// an object-store location when alias is configured; anything else is a local path.
class Resolver {
public:
    explicit Resolver(const config::Config& config) : config_(config) {}

    [[nodiscard]] Location resolve(const std::string& url) const;

    [[nodiscard]] std::shared_ptr<Client> connect(const Location& location) const;

private:
    const config::Config& config_;
};

}
