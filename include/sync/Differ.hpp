#pragma once

#include "sync/model/Diff.hpp"
#include "storage/Client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ms::sync {

// Lock-step merge of a source and a target listing. Each call to next()
// yields one classification, or an entry carrying only a listing error.
//
// A subtree one side failed to list, or a path whose type differs between the
// sides, is fenced: nothing at or below it is classified on either side.
class Differ {
public:
    Differ(const storage::Client& source, const storage::Client& target, bool recursive);

    [[nodiscard]] std::optional<model::DiffEntry> next();

    [[nodiscard]] const std::vector<std::string>& fenced() const { return fenced_; }

private:
    std::unique_ptr<storage::Lister> sourceList_;
    std::unique_ptr<storage::Lister> targetList_;
    std::optional<storage::model::Entry> srcHead_;
    std::optional<storage::model::Entry> tgtHead_;
    bool needSrc_ = true;
    bool needTgt_ = true;
    bool srcDone_ = false;
    bool tgtDone_ = false;
    std::vector<std::string> fenced_;

    [[nodiscard]] bool isFenced(const std::string& path) const;
    model::DiffEntry fence(storage::Error error, model::DiffKind side);
};

}
