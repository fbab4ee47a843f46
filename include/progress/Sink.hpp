#pragma once

#include "sync/model/WorkItem.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ms::config { struct DisplayConfig; }

namespace ms::progress {

struct Summary {
    uint64_t objects = 0;
    uint64_t bytes = 0;
    uint64_t errors = 0;
    uint64_t totalObjects = 0;
    uint64_t totalBytes = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] double bytesPerSecond() const;
};

// Where a run reports what it is doing. The public calls keep the counters,
// subclasses only decide how things look.
class Sink {
public:
    Sink();
    virtual ~Sink() = default;

    void setTotal(uint64_t objects, uint64_t bytes);
    void reportProgress(uint64_t bytes);
    void reportSuccess(const sync::model::WorkItem& item);
    // partialBytes were reported for the item before it failed and are taken back.
    void reportError(const sync::model::WorkItem& item, uint64_t partialBytes = 0);
    void setCaption(const std::string& caption);
    void message(const std::string& text);

    // Idempotent; the first call prints the closing line.
    Summary finish();

    [[nodiscard]] Summary snapshot() const;

protected:
    virtual void onProgress(const Summary&) {}
    virtual void onSuccess(const sync::model::WorkItem&, const Summary&) {}
    virtual void onError(const sync::model::WorkItem& item, const Summary& s) = 0;
    virtual void onCaption(const std::string&) {}
    virtual void onMessage(const std::string&) {}
    virtual void onFinish(const Summary&) {}

private:
    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point start_;
    Summary summary_;
    bool finished_ = false;

    [[nodiscard]] Summary snapshotLocked() const;
};

std::unique_ptr<Sink> makeSink(const config::DisplayConfig& display);

}
