#pragma once

#include "sync/model/Diff.hpp"
#include "sync/model/Message.hpp"
#include "sync/model/Policy.hpp"
#include "sync/model/WorkItem.hpp"
#include "concurrency/Channel.hpp"

#include <atomic>
#include <optional>

namespace ms::sync {

class Differ;

// Turns differ output into work items and feeds them to the work channel.
class Planner {
public:
    Planner(const model::Policy& policy, model::Tally& tally, concurrency::Channel<model::WorkItem>& out,
            const std::atomic<bool>& interrupt, concurrency::Channel<model::Message>* journal = nullptr);

    // Drains differ completely. Returns false if interrupted first.
    bool prepare(Differ& differ, const storage::Location& source, const storage::Location& target, size_t targetIndex);

    // The decision table. nullopt means nothing to do for this entry.
    [[nodiscard]] static std::optional<model::WorkItem> decide(const model::DiffEntry& diff, const model::Policy& policy,
                                                               const storage::Location& source,
                                                               const storage::Location& target, size_t targetIndex);

    [[nodiscard]] uint64_t emitted() const { return emitted_; }

    // Subtrees that could not be listed. A plan with any is incomplete.
    [[nodiscard]] uint64_t listingErrors() const { return listingErrors_; }

private:
    const model::Policy& policy_;
    model::Tally& tally_;
    concurrency::Channel<model::WorkItem>& out_;
    const std::atomic<bool>& interrupt_;
    concurrency::Channel<model::Message>* journal_;
    uint64_t emitted_ = 0;
    uint64_t listingErrors_ = 0;
};

}
