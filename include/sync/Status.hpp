#pragma once

#include "sync/model/Message.hpp"
#include "concurrency/Channel.hpp"

#include <cstdint>
#include <unordered_map>

namespace ms::progress { class Sink; }

namespace ms::sync {

class Session;

// The single consumer of status messages. Owns the progress sink and the
// session log for the duration of a run.
class Status {
public:
    struct Outcome {
        uint64_t done = 0;
        uint64_t failures = 0;
        uint64_t transient = 0;
        uint64_t vanished = 0;
        bool prepared = false;
    };

    Status(progress::Sink& sink, Session* session);

    // Returns once the channel is closed and empty.
    void run(concurrency::Channel<model::Message>& channel);

    void apply(const model::Message& message);

    [[nodiscard]] const Outcome& outcome() const { return outcome_; }

private:
    progress::Sink& sink_;
    Session* session_;
    Outcome outcome_;
    std::unordered_map<uint64_t, uint64_t> inflight_;

    void onPlanned(const model::msg::Planned& m);
    void onProgress(const model::msg::Progress& m);
    void onDone(const model::msg::Done& m);
    void onFailed(const model::msg::Failed& m);
    void onVanished(const model::msg::Vanished& m);
    void onPrepared(const model::msg::Prepared& m);
};

}
