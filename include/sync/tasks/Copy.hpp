#pragma once

#include "concurrency/AdmissionGate.hpp"
#include "concurrency/Channel.hpp"
#include "concurrency/Task.hpp"
#include "sync/model/Message.hpp"

namespace ms::storage { class Client; }

namespace ms::sync::tasks {

struct Copy final : concurrency::Task {
    const storage::Client& source;
    const storage::Client& target;
    model::WorkItem item;
    concurrency::AdmissionGate::Slot slot;
    concurrency::Channel<model::Message>& status;

    Copy(const storage::Client& source, const storage::Client& target, model::WorkItem item,
         concurrency::AdmissionGate::Slot slot, concurrency::Channel<model::Message>& status);

    void operator()() override;
};

}
