#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace ms::concurrency {

// Counting gate limiting in-flight transfers. A Slot returns its permit when
// destroyed, whichever way the holder exits.
class AdmissionGate {
public:
    class Slot {
    public:
        Slot() = default;
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept {
            if (this != &other) {
                reset();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        ~Slot() { reset(); }

        void reset() {
            if (gate_) gate_->release();
            gate_ = nullptr;
        }

        [[nodiscard]] bool held() const { return gate_ != nullptr; }

    private:
        friend class AdmissionGate;
        explicit Slot(AdmissionGate* gate) : gate_(gate) {}
        AdmissionGate* gate_ = nullptr;
    };

    explicit AdmissionGate(unsigned int capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Blocks for a free permit; nullopt when interrupt is raised first.
    [[nodiscard]] std::optional<Slot> acquire(const std::atomic<bool>* interrupt = nullptr);

    // Blocks until every permit has been returned.
    void waitIdle();

    [[nodiscard]] unsigned int capacity() const { return capacity_; }

    // Highest number of permits ever held at once.
    [[nodiscard]] unsigned int peak() const;

private:
    const unsigned int capacity_;
    unsigned int used_ = 0;
    unsigned int peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    void release();
};

}
