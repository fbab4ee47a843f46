#pragma once

#include "storage/Client.hpp"

#include <filesystem>

namespace ms::storage {

namespace fs = std::filesystem;

class LocalClient final : public Client {
public:
    explicit LocalClient(Location location);

    [[nodiscard]] std::unique_ptr<Lister> list(const std::string& rel, bool recursive, bool includeDirs) const override;
    [[nodiscard]] model::Entry stat(const std::string& rel) const override;

    [[nodiscard]] std::unique_ptr<std::istream> get(const std::string& rel) const override;
    void put(const std::string& rel, uint64_t sizeHint, std::istream& in) const override;
    void remove(const std::string& rel) const override;

    [[nodiscard]] std::unique_ptr<Subscription> subscribe(bool recursive) const override;

    [[nodiscard]] const fs::path& root() const { return root_; }
    [[nodiscard]] fs::path absPath(const std::string& rel) const;

private:
    fs::path root_;
};

}
