#include "storage/Resolver.hpp"
#include "storage/Error.hpp"
#include "storage/local/LocalClient.hpp"
#include "storage/s3/S3Client.hpp"
#include "config/Config.hpp"
#include "util/pathOrder.hpp"

#include <filesystem>

using namespace ms::storage;

Location Resolver::resolve(const std::string& url) const {
    if (url.empty()) throw StorageError(ErrorKind::InvalidArgument, url, "empty location");

    const auto slash = url.find('/');
    if (slash != 0) {
        const auto head = url.substr(0, slash);
        if (const auto it = config_.aliases.find(head); it != config_.aliases.end()) {
            const auto rest = slash == std::string::npos ? std::string{} : util::normalizeRel(url.substr(slash + 1));
            if (rest.empty())
                throw StorageError(ErrorKind::InvalidArgument, url, "object-store location needs a bucket name");

            Location loc;
            loc.alias = head;
            loc.path = rest;
            loc.resolved = it->second.url + "/" + rest;
            loc.type = ClientType::S3;
            return loc;
        }
    }

    auto abs = std::filesystem::absolute(url).lexically_normal().string();
    while (abs.size() > 1 && abs.back() == '/') abs.pop_back();

    Location loc;
    loc.path = url;
    loc.resolved = abs;
    loc.type = ClientType::Local;
    return loc;
}

std::shared_ptr<Client> Resolver::connect(const Location& location) const {
    if (location.type == ClientType::Local) return std::make_shared<LocalClient>(location);

    if (!location.alias) throw StorageError(ErrorKind::InvalidArgument, location.path, "missing alias");
    const auto it = config_.aliases.find(*location.alias);
    if (it == config_.aliases.end())
        throw StorageError(ErrorKind::InvalidArgument, location.path,
                           fmt::format("unknown alias '{}'", *location.alias));
    return std::make_shared<S3Client>(location, it->second, config_.mirror);
}
