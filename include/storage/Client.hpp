#pragma once

#include "storage/Error.hpp"
#include "storage/Location.hpp"
#include "storage/model/Entry.hpp"
#include "storage/model/Event.hpp"

#include <chrono>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace ms::storage {

struct ListItem {
    std::optional<model::Entry> entry{};
    std::optional<Error> error{};
};

// Lazy listing in component-wise path order (see util::pathLess).
class Lister {
public:
    virtual ~Lister() = default;
    virtual std::optional<ListItem> next() = 0;
};

class Subscription {
public:
    virtual ~Subscription() = default;

    // Blocks up to timeout; nullopt means nothing arrived.
    virtual std::optional<model::EventItem> poll(std::chrono::milliseconds timeout) = 0;
};

class Client {
public:
    explicit Client(Location location) : location_(std::move(location)) {}
    virtual ~Client() = default;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] const Location& location() const { return location_; }
    [[nodiscard]] ClientType type() const { return location_.type; }

    // Human-readable address of rel under this client's root.
    [[nodiscard]] virtual std::string url(const std::string& rel) const;

    // ##### Listing #####

    [[nodiscard]] virtual std::unique_ptr<Lister> list(const std::string& rel, bool recursive, bool includeDirs) const = 0;

    // Throws StorageError{NotFound} when nothing lives at rel.
    [[nodiscard]] virtual model::Entry stat(const std::string& rel) const = 0;

    // ##### Object Operations #####

    [[nodiscard]] virtual std::unique_ptr<std::istream> get(const std::string& rel) const = 0;
    virtual void put(const std::string& rel, uint64_t sizeHint, std::istream& in) const = 0;
    virtual void remove(const std::string& rel) const = 0;

    // ##### Notifications #####

    // Throws StorageError{NotImplemented} when the backend cannot watch.
    [[nodiscard]] virtual std::unique_ptr<Subscription> subscribe(bool recursive) const = 0;

protected:
    Location location_;
};

}
