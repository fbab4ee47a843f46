#include "storage/Client.hpp"
#include "util/pathOrder.hpp"

#include <nlohmann/json.hpp>

using namespace ms::storage;

std::string Client::url(const std::string& rel) const {
    return util::joinPath(location_.resolved, rel);
}

namespace ms::storage {

void to_json(nlohmann::json& j, const Location& l) {
    j = {
        {"path", l.path},
        {"resolved", l.resolved},
        {"type", l.type == ClientType::S3 ? "s3" : "local"}
    };
    if (l.alias) j["alias"] = *l.alias;
}

void from_json(const nlohmann::json& j, Location& l) {
    l.path = j.at("path").get<std::string>();
    l.resolved = j.at("resolved").get<std::string>();
    l.type = j.value("type", "local") == "s3" ? ClientType::S3 : ClientType::Local;
    if (j.contains("alias")) l.alias = j.at("alias").get<std::string>();
}

}
