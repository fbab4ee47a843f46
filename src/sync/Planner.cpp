#include "sync/Planner.hpp"
#include "sync/Differ.hpp"
#include "log/Registry.hpp"

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;

Planner::Planner(const Policy& policy, Tally& tally, concurrency::Channel<WorkItem>& out,
                 const std::atomic<bool>& interrupt, concurrency::Channel<Message>* journal)
    : policy_(policy), tally_(tally), out_(out), interrupt_(interrupt), journal_(journal) {}

std::optional<WorkItem> Planner::decide(const DiffEntry& diff, const Policy& policy,
                                        const Location& source, const Location& target, const size_t targetIndex) {
    if (diff.error) return WorkItem::failure(*diff.error, targetIndex);

    const auto srcEndpoint = [&] { return Endpoint{source, *diff.source}; };
    const auto tgtEndpoint = [&](const model::Endpoint& fallback) {
        return diff.target ? Endpoint{target, *diff.target} : Endpoint{target, fallback.entry};
    };

    switch (diff.kind) {
    case DiffKind::OnlyInSource: {
        if (diff.source->isDir) return std::nullopt; // parents are created alongside files
        auto src = srcEndpoint();
        auto tgt = Endpoint{target, src.entry};
        tgt.entry.mtime.reset();
        tgt.entry.version.reset();
        return WorkItem::copy(std::move(src), std::move(tgt), targetIndex);
    }
    case DiffKind::OnlyInTarget:
        if (diff.target->isDir || !policy.allowsDelete()) return std::nullopt;
        return WorkItem::remove(Endpoint{target, *diff.target}, targetIndex);

    case DiffKind::DiffersInSize: {
        auto src = srcEndpoint();
        auto tgt = tgtEndpoint(src);
        if (policy.force) return WorkItem::copy(std::move(src), std::move(tgt), targetIndex);
        auto err = Error{ErrorKind::OverwriteNotAllowed, tgt.url(),
                         "overwrite not allowed, target exists with a different size (use --force to overwrite)"};
        return WorkItem::failure(std::move(err), targetIndex, std::move(src), std::move(tgt));
    }
    case DiffKind::DiffersInType: {
        auto src = srcEndpoint();
        auto tgt = tgtEndpoint(src);
        auto err = Error{ErrorKind::InvalidTarget, tgt.url(),
                         fmt::format("type mismatch, source is a {} but target is a {}",
                                     src.entry.isDir ? "directory" : "file",
                                     tgt.entry.isDir ? "directory" : "file")};
        return WorkItem::failure(std::move(err), targetIndex, std::move(src), std::move(tgt));
    }
    case DiffKind::DiffersInTimeOnly:
    case DiffKind::Identical:
        return std::nullopt;
    }
    return std::nullopt;
}

bool Planner::prepare(Differ& differ, const Location& source, const Location& target, const size_t targetIndex) {
    log::Registry::sync()->debug("[Planner] Comparing {} with {}", source.resolved, target.resolved);

    while (!interrupt_.load()) {
        auto diff = differ.next();
        if (!diff) {
            log::Registry::sync()->debug("[Planner] {} planned {} items, {} listing errors",
                                         target.resolved, emitted_, listingErrors_);
            return true;
        }
        if (diff->isError()) ++listingErrors_;

        auto item = decide(*diff, policy_, source, target, targetIndex);
        if (!item) continue;

        tally_.stamp(*item);
        // journal first, so a logged completion never precedes its plan entry
        if (journal_) journal_->push(model::msg::Planned{*item});
        if (!out_.push(std::move(*item), &interrupt_)) return false;
        ++emitted_;
    }

    log::Registry::sync()->info("[Planner] Interrupted while comparing {}", target.resolved);
    return false;
}
