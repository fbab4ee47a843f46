#pragma once

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ms::storage {

enum class ClientType { Local, S3 };

struct Location {
    std::optional<std::string> alias{};
    std::string path;       // as given, minus the alias component
    std::string resolved;   // absolute local path, or endpoint/bucket/prefix
    ClientType type{ClientType::Local};

    [[nodiscard]] bool operator==(const Location& other) const {
        return type == other.type && resolved == other.resolved;
    }
};

void to_json(nlohmann::json& j, const Location& l);
void from_json(const nlohmann::json& j, Location& l);

}
