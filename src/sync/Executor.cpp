#include "sync/Executor.hpp"
#include "sync/tasks/Copy.hpp"
#include "sync/tasks/Delete.hpp"
#include "log/Registry.hpp"

#include <chrono>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;
using namespace ms::log;

Executor::Executor(const Client& source, std::vector<std::shared_ptr<Client>> targets,
                   const Policy& policy, concurrency::ThreadPool& pool, concurrency::AdmissionGate& gate,
                   concurrency::Channel<Message>& status, const std::atomic<bool>& interrupt)
    : source_(source), targets_(std::move(targets)), policy_(policy), pool_(pool), gate_(gate),
      status_(status), interrupt_(interrupt) {}

void Executor::run(concurrency::Channel<WorkItem>& work) {
    while (!interrupt_.load()) {
        auto item = work.popFor(std::chrono::milliseconds(100));
        if (!item) {
            if (work.drained()) break;
            continue;
        }
        dispatch(std::move(*item));
    }

    if (interrupt_.load()) {
        abandoned_ += work.size();
        Registry::sync()->info("[Executor] Interrupted, {} queued items not started", abandoned_);
    }

    // in-flight transfers finish on their own
    gate_.waitIdle();
    Registry::sync()->debug("[Executor] Dispatched {} items", dispatched_);
}

void Executor::dispatch(WorkItem item) {
    // error items never touch storage
    if (item.error) {
        status_.push(msg::Failed{std::move(item)});
        return;
    }

    if (item.replay || policy_.fake) {
        status_.push(msg::Done{std::move(item)});
        return;
    }

    if (item.targetIndex >= targets_.size()) {
        item.error = Error{ErrorKind::InvalidArgument, item.target.url(), "work item names an unknown target"};
        status_.push(msg::Failed{std::move(item)});
        return;
    }

    auto slot = gate_.acquire(&interrupt_);
    if (!slot) {
        ++abandoned_;
        return;
    }

    const auto& target = *targets_[item.targetIndex];
    ++dispatched_;

    if (item.isCopy())
        pool_.submit(std::make_shared<tasks::Copy>(source_, target, std::move(item), std::move(*slot), status_));
    else
        pool_.submit(std::make_shared<tasks::Delete>(target, std::move(item), std::move(*slot), status_));
}
