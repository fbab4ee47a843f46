#include "storage/Error.hpp"

#include <nlohmann/json.hpp>

using namespace ms::storage;

namespace ms::storage {

std::string_view to_string(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::NotImplemented: return "not-implemented";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::InvalidArgument: return "invalid-argument";
        case ErrorKind::InvalidTarget: return "invalid-target";
        case ErrorKind::OverwriteNotAllowed: return "overwrite-not-allowed";
        case ErrorKind::IO: return "io";
        case ErrorKind::Interrupted: return "interrupted";
    }
    return "io";
}

ErrorKind errorKindFromString(const std::string_view s) {
    for (const auto k : {ErrorKind::NotFound, ErrorKind::NotImplemented, ErrorKind::Transport, ErrorKind::Auth,
                         ErrorKind::InvalidArgument, ErrorKind::InvalidTarget, ErrorKind::OverwriteNotAllowed,
                         ErrorKind::IO, ErrorKind::Interrupted})
        if (to_string(k) == s) return k;
    throw std::invalid_argument(fmt::format("Unknown error kind: {}", s));
}

void to_json(nlohmann::json& j, const Error& e) {
    j = {
        {"kind", std::string(to_string(e.kind))},
        {"path", e.path},
        {"message", e.message}
    };
}

void from_json(const nlohmann::json& j, Error& e) {
    e.kind = errorKindFromString(j.at("kind").get<std::string>());
    e.path = j.value("path", "");
    e.message = j.value("message", "");
}

}

std::string Error::describe() const {
    if (path.empty()) return message;
    return fmt::format("{}: {}", path, message);
}
