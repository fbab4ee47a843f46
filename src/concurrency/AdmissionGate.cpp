#include "concurrency/AdmissionGate.hpp"

#include <algorithm>
#include <chrono>

using namespace ms::concurrency;

AdmissionGate::AdmissionGate(const unsigned int capacity) : capacity_(std::max(capacity, 1u)) {}

std::optional<AdmissionGate::Slot> AdmissionGate::acquire(const std::atomic<bool>* interrupt) {
    std::unique_lock lock(mutex_);
    while (used_ >= capacity_) {
        if (interrupt && interrupt->load()) return std::nullopt;
        cv_.wait_for(lock, std::chrono::milliseconds(100));
    }
    if (interrupt && interrupt->load()) return std::nullopt;
    ++used_;
    peak_ = std::max(peak_, used_);
    return Slot(this);
}

void AdmissionGate::release() {
    {
        std::scoped_lock lock(mutex_);
        --used_;
    }
    cv_.notify_all();
}

void AdmissionGate::waitIdle() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return used_ == 0; });
}

unsigned int AdmissionGate::peak() const {
    std::scoped_lock lock(mutex_);
    return peak_;
}
