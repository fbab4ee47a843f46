#pragma once

#include "storage/Error.hpp"
#include "storage/model/Entry.hpp"

#include <optional>
#include <string_view>

namespace ms::sync::model {

enum class DiffKind {
    OnlyInSource,
    OnlyInTarget,
    DiffersInType,
    DiffersInSize,
    DiffersInTimeOnly,
    Identical,
};

struct DiffEntry {
    DiffKind kind{DiffKind::Identical};
    std::optional<storage::model::Entry> source{};
    std::optional<storage::model::Entry> target{};
    std::optional<storage::Error> error{}; // when set, kind and entries carry no meaning

    [[nodiscard]] bool isError() const { return error.has_value(); }
};

std::string_view to_string(DiffKind kind);

// Classification of two entries sharing one path.
DiffKind classify(const storage::model::Entry& source, const storage::model::Entry& target);

}
