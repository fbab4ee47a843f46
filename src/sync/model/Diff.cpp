#include "sync/model/Diff.hpp"

namespace ms::sync::model {

std::string_view to_string(const DiffKind kind) {
    switch (kind) {
        case DiffKind::OnlyInSource: return "only-in-source";
        case DiffKind::OnlyInTarget: return "only-in-target";
        case DiffKind::DiffersInType: return "differs-in-type";
        case DiffKind::DiffersInSize: return "differs-in-size";
        case DiffKind::DiffersInTimeOnly: return "differs-in-time-only";
        case DiffKind::Identical: return "identical";
    }
    return "identical";
}

DiffKind classify(const storage::model::Entry& source, const storage::model::Entry& target) {
    if (source.isDir != target.isDir) return DiffKind::DiffersInType;
    if (source.isDir) return DiffKind::Identical;
    if (source.size != target.size) return DiffKind::DiffersInSize;
    if (source.mtime && target.mtime && *source.mtime != *target.mtime) return DiffKind::DiffersInTimeOnly;
    return DiffKind::Identical;
}

}
