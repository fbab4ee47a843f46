#include "progress/Sink.hpp"
#include "progress/BarSink.hpp"
#include "progress/JsonSink.hpp"
#include "progress/QuietSink.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <iostream>

using namespace ms::progress;
using namespace ms::sync::model;

double Summary::bytesPerSecond() const {
    const auto ms = elapsed.count();
    if (ms <= 0) return 0.0;
    return static_cast<double>(bytes) * 1000.0 / static_cast<double>(ms);
}

Sink::Sink() : start_(std::chrono::steady_clock::now()) {}

Summary Sink::snapshotLocked() const {
    Summary s = summary_;
    if (!finished_)
        s.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    return s;
}

Summary Sink::snapshot() const {
    std::scoped_lock lock(mutex_);
    return snapshotLocked();
}

void Sink::setTotal(const uint64_t objects, const uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    summary_.totalObjects = std::max(summary_.totalObjects, objects);
    summary_.totalBytes = std::max(summary_.totalBytes, bytes);
}

void Sink::reportProgress(const uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    summary_.bytes += bytes;
    onProgress(snapshotLocked());
}

void Sink::reportSuccess(const WorkItem& item) {
    std::scoped_lock lock(mutex_);
    ++summary_.objects;
    onSuccess(item, snapshotLocked());
}

void Sink::reportError(const WorkItem& item, const uint64_t partialBytes) {
    std::scoped_lock lock(mutex_);
    ++summary_.errors;
    summary_.bytes -= std::min(summary_.bytes, partialBytes);
    onError(item, snapshotLocked());
}

void Sink::setCaption(const std::string& caption) {
    std::scoped_lock lock(mutex_);
    onCaption(caption);
}

void Sink::message(const std::string& text) {
    std::scoped_lock lock(mutex_);
    onMessage(text);
}

Summary Sink::finish() {
    std::scoped_lock lock(mutex_);
    if (finished_) return summary_;
    summary_ = snapshotLocked();
    finished_ = true;
    onFinish(summary_);
    return summary_;
}

namespace ms::progress {

std::unique_ptr<Sink> makeSink(const config::DisplayConfig& display) {
    if (display.json) return std::make_unique<JsonSink>(std::cout);
    if (display.quiet) return std::make_unique<QuietSink>(display.color);
    return std::make_unique<BarSink>(display.color);
}

}
