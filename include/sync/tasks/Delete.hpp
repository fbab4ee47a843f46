#pragma once

#include "concurrency/AdmissionGate.hpp"
#include "concurrency/Channel.hpp"
#include "concurrency/Task.hpp"
#include "sync/model/Message.hpp"

namespace ms::storage { class Client; }

namespace ms::sync::tasks {

struct Delete final : concurrency::Task {
    const storage::Client& target;
    model::WorkItem item;
    concurrency::AdmissionGate::Slot slot;
    concurrency::Channel<model::Message>& status;

    Delete(const storage::Client& target, model::WorkItem item,
           concurrency::AdmissionGate::Slot slot, concurrency::Channel<model::Message>& status);

    void operator()() override;
};

}
