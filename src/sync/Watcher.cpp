#include "sync/Watcher.hpp"
#include "log/Registry.hpp"

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;
using namespace ms::log;

Watcher::Watcher(const Client& source, const Client& target, const size_t targetIndex,
                 const Policy& policy, Tally& tally, concurrency::Channel<WorkItem>& out,
                 const std::atomic<bool>& interrupt, const std::chrono::milliseconds pollInterval)
    : source_(source), target_(target), targetIndex_(targetIndex), policy_(policy), tally_(tally),
      out_(out), interrupt_(interrupt), pollInterval_(pollInterval) {}

void Watcher::run() {
    std::unique_ptr<Subscription> sub;
    try {
        sub = source_.subscribe(true);
    } catch (const StorageError& e) {
        if (e.kind() == ErrorKind::NotImplemented) {
            Registry::watch()->info("[Watcher] {} cannot be watched, continuous mode unavailable: {}",
                                    source_.location().resolved, e.what());
            return;
        }
        WorkItem item = WorkItem::failure(e.error(), targetIndex_);
        tally_.stamp(item);
        out_.push(std::move(item), &interrupt_);
        return;
    }
    run(*sub);
}

void Watcher::run(Subscription& subscription) {
    Registry::watch()->info("[Watcher] Watching {} for changes", source_.location().resolved);

    while (!interrupt_.load()) {
        auto polled = subscription.poll(pollInterval_);
        if (!polled) continue;

        if (polled->error) {
            if (polled->error->kind == ErrorKind::NotImplemented) {
                Registry::watch()->info("[Watcher] Notifications unsupported for {}, stopping",
                                        source_.location().resolved);
                return;
            }
            WorkItem item = WorkItem::failure(*polled->error, targetIndex_);
            tally_.stamp(item);
            if (!out_.push(std::move(item), &interrupt_)) return;
            continue;
        }

        if (!polled->event) continue;

        auto item = handle(*polled->event);
        if (!item) continue;

        tally_.stamp(*item);
        if (!out_.push(std::move(*item), &interrupt_)) return;
        ++emitted_;
    }

    Registry::watch()->debug("[Watcher] Stopped watching {} after {} items", source_.location().resolved, emitted_);
}

std::optional<WorkItem> Watcher::handle(const storage::model::Event& event) const {
    switch (event.type) {
        case storage::model::EventType::Create: return onCreate(event);
        case storage::model::EventType::Remove: return onRemove(event);
    }
    return std::nullopt;
}

std::optional<WorkItem> Watcher::onCreate(const storage::model::Event& event) const {
    storage::model::Entry entry{event.path, event.size, false, std::nullopt, std::nullopt};

    if (event.size == 0) {
        // notification sizes are unreliable for streamed writes
        try {
            entry = source_.stat(event.path);
        } catch (const StorageError& e) {
            Registry::watch()->debug("[Watcher] Dropping create of {}: {}", event.path, e.what());
            return std::nullopt;
        }
        if (entry.isDir) return std::nullopt;
    }

    if (!policy_.force) {
        try {
            (void) target_.stat(event.path);
            Registry::watch()->debug("[Watcher] {} already exists on {}, not overwriting",
                                     event.path, target_.location().resolved);
            return std::nullopt;
        } catch (const StorageError& e) {
            if (e.kind() != ErrorKind::NotFound)
                Registry::watch()->debug("[Watcher] Existence check for {} failed: {}", event.path, e.what());
        }
    }

    Endpoint src{source_.location(), entry};
    Endpoint tgt{target_.location(), storage::model::Entry{event.path, entry.size, false, std::nullopt, std::nullopt}};
    return WorkItem::copy(std::move(src), std::move(tgt), targetIndex_);
}

std::optional<WorkItem> Watcher::onRemove(const storage::model::Event& event) const {
    if (!policy_.allowsDelete()) return std::nullopt;
    return WorkItem::remove(Endpoint{target_.location(), storage::model::Entry{event.path, 0, false, std::nullopt, std::nullopt}},
                            targetIndex_);
}
