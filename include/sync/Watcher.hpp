#pragma once

#include "sync/model/Policy.hpp"
#include "sync/model/WorkItem.hpp"
#include "storage/Client.hpp"
#include "concurrency/Channel.hpp"

#include <atomic>
#include <chrono>
#include <optional>

namespace ms::sync {

// Continuous producer: turns source change notifications into work items
// for one target.
class Watcher {
public:
    Watcher(const storage::Client& source, const storage::Client& target, size_t targetIndex,
            const model::Policy& policy, model::Tally& tally, concurrency::Channel<model::WorkItem>& out,
            const std::atomic<bool>& interrupt, std::chrono::milliseconds pollInterval);

    // Runs until interrupted, or quietly returns when the source cannot be watched.
    void run();

    // Same loop over an existing subscription.
    void run(storage::Subscription& subscription);

    // Per-event decision. nullopt means the event is dropped.
    [[nodiscard]] std::optional<model::WorkItem> handle(const storage::model::Event& event) const;

    [[nodiscard]] uint64_t emitted() const { return emitted_; }

private:
    const storage::Client& source_;
    const storage::Client& target_;
    size_t targetIndex_;
    const model::Policy& policy_;
    model::Tally& tally_;
    concurrency::Channel<model::WorkItem>& out_;
    const std::atomic<bool>& interrupt_;
    std::chrono::milliseconds pollInterval_;
    uint64_t emitted_ = 0;

    [[nodiscard]] std::optional<model::WorkItem> onCreate(const storage::model::Event& event) const;
    [[nodiscard]] std::optional<model::WorkItem> onRemove(const storage::model::Event& event) const;
};

}
