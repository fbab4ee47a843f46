#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ms::storage::model {

struct Entry {
    std::string path;           // relative to the client root, '/'-separated, no leading slash
    uint64_t size = 0;
    bool isDir = false;
    std::optional<std::time_t> mtime{};
    std::optional<std::string> version{};

    [[nodiscard]] std::string name() const;
};

void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

}
