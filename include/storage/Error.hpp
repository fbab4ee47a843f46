#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/format.h>
#include <nlohmann/json_fwd.hpp>

namespace ms::storage {

enum class ErrorKind {
    NotFound,
    NotImplemented,
    Transport,
    Auth,
    InvalidArgument,
    InvalidTarget,
    OverwriteNotAllowed,
    IO,
    Interrupted,
};

struct Error {
    ErrorKind kind{ErrorKind::IO};
    std::string path;
    std::string message;

    // Timeouts, resets and server-side failures; a later resume may succeed.
    [[nodiscard]] bool transient() const { return kind == ErrorKind::Transport; }

    [[nodiscard]] std::string describe() const;
};

std::string_view to_string(ErrorKind kind);
ErrorKind errorKindFromString(std::string_view s);

void to_json(nlohmann::json& j, const Error& e);
void from_json(const nlohmann::json& j, Error& e);

class StorageError : public std::runtime_error {
public:
    explicit StorageError(Error err)
        : std::runtime_error(err.describe()), error_(std::move(err)) {}

    StorageError(const ErrorKind kind, std::string path, std::string message)
        : StorageError(Error{kind, std::move(path), std::move(message)}) {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorKind kind() const noexcept { return error_.kind; }

private:
    Error error_;
};

}
