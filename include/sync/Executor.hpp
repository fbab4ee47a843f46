#pragma once

#include "sync/model/Message.hpp"
#include "sync/model/Policy.hpp"
#include "concurrency/AdmissionGate.hpp"
#include "concurrency/Channel.hpp"
#include "concurrency/ThreadPool.hpp"
#include "storage/Client.hpp"

#include <atomic>
#include <memory>
#include <vector>

namespace ms::sync {

// Consumes work items and runs them on the pool, never more than the gate
// admits at once. Every outcome is reported on the status channel.
class Executor {
public:
    Executor(const storage::Client& source, std::vector<std::shared_ptr<storage::Client>> targets,
             const model::Policy& policy, concurrency::ThreadPool& pool, concurrency::AdmissionGate& gate,
             concurrency::Channel<model::Message>& status, const std::atomic<bool>& interrupt);

    // Returns once work is drained (or interrupted) and in-flight transfers have finished.
    void run(concurrency::Channel<model::WorkItem>& work);

    [[nodiscard]] uint64_t dispatched() const { return dispatched_; }
    [[nodiscard]] uint64_t abandoned() const { return abandoned_; }

private:
    const storage::Client& source_;
    std::vector<std::shared_ptr<storage::Client>> targets_;
    const model::Policy& policy_;
    concurrency::ThreadPool& pool_;
    concurrency::AdmissionGate& gate_;
    concurrency::Channel<model::Message>& status_;
    const std::atomic<bool>& interrupt_;
    uint64_t dispatched_ = 0;
    uint64_t abandoned_ = 0;

    void dispatch(model::WorkItem item);
};

}
