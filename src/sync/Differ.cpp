#include "sync/Differ.hpp"
#include "util/pathOrder.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <utility>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;

Differ::Differ(const Client& source, const Client& target, const bool recursive)
    : sourceList_(source.list("", recursive, true)),
      targetList_(target.list("", recursive, true)) {}

bool Differ::isFenced(const std::string& path) const {
    return std::ranges::any_of(fenced_, [&](const std::string& p) { return util::isWithin(path, p); });
}

DiffEntry Differ::fence(Error error, const DiffKind side) {
    error.path = util::normalizeRel(error.path);
    log::Registry::sync()->debug("[Differ] Listing failed under '{}', skipping it on both sides: {}",
                                 error.path, error.message);
    fenced_.push_back(error.path);

    // a head already pulled from the other side may sit inside the failed subtree
    if (srcHead_ && isFenced(srcHead_->path)) {
        srcHead_.reset();
        needSrc_ = true;
    }
    if (tgtHead_ && isFenced(tgtHead_->path)) {
        tgtHead_.reset();
        needTgt_ = true;
    }
    return DiffEntry{side, std::nullopt, std::nullopt, std::move(error)};
}

std::optional<DiffEntry> Differ::next() {
    while (needSrc_ && !srcDone_) {
        auto item = sourceList_->next();
        if (!item) {
            srcDone_ = true;
            break;
        }
        if (item->error) return fence(std::move(*item->error), DiffKind::OnlyInSource);
        if (isFenced(item->entry->path)) continue;
        srcHead_ = std::move(item->entry);
        needSrc_ = false;
    }

    while (needTgt_ && !tgtDone_) {
        auto item = targetList_->next();
        if (!item) {
            tgtDone_ = true;
            break;
        }
        if (item->error) {
            // a target root that does not exist yet is an empty listing
            if (item->error->kind == ErrorKind::NotFound && item->error->path.empty()) {
                log::Registry::sync()->debug("[Differ] Target root missing, treating it as empty");
                continue;
            }
            return fence(std::move(*item->error), DiffKind::OnlyInTarget);
        }
        if (isFenced(item->entry->path)) continue;
        tgtHead_ = std::move(item->entry);
        needTgt_ = false;
    }

    if (!srcHead_ && !tgtHead_) return std::nullopt;

    const int cmp = !srcHead_ ? 1 : !tgtHead_ ? -1 : util::comparePaths(srcHead_->path, tgtHead_->path);

    DiffEntry out;
    if (cmp < 0) {
        out.kind = DiffKind::OnlyInSource;
        out.source = std::exchange(srcHead_, std::nullopt);
        needSrc_ = true;
    } else if (cmp > 0) {
        out.kind = DiffKind::OnlyInTarget;
        out.target = std::exchange(tgtHead_, std::nullopt);
        needTgt_ = true;
    } else {
        out.kind = classify(*srcHead_, *tgtHead_);
        // a file against a directory is reported once, its subtree is left alone
        if (out.kind == DiffKind::DiffersInType) fenced_.push_back(srcHead_->path);
        out.source = std::exchange(srcHead_, std::nullopt);
        out.target = std::exchange(tgtHead_, std::nullopt);
        needSrc_ = needTgt_ = true;
    }
    return out;
}
