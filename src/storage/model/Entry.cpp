#include "storage/model/Entry.hpp"

#include <nlohmann/json.hpp>

namespace ms::storage::model {

std::string Entry::name() const {
    const auto pos = path.rfind('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

void to_json(nlohmann::json& j, const Entry& e) {
    j = {
        {"path", e.path},
        {"size", e.size},
        {"is_dir", e.isDir}
    };
    if (e.mtime) j["mtime"] = static_cast<int64_t>(*e.mtime);
    if (e.version) j["version"] = *e.version;
}

void from_json(const nlohmann::json& j, Entry& e) {
    e.path = j.at("path").get<std::string>();
    e.size = j.value("size", uint64_t{0});
    e.isDir = j.value("is_dir", false);
    if (j.contains("mtime")) e.mtime = static_cast<std::time_t>(j.at("mtime").get<int64_t>());
    if (j.contains("version")) e.version = j.at("version").get<std::string>();
}

}
