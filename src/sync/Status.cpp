#include "sync/Status.hpp"
#include "sync/Session.hpp"
#include "progress/Sink.hpp"
#include "log/Registry.hpp"

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::log;

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

}

Status::Status(progress::Sink& sink, Session* session) : sink_(sink), session_(session) {}

void Status::run(concurrency::Channel<Message>& channel) {
    while (auto message = channel.pop()) apply(*message);
}

void Status::apply(const Message& message) {
    std::visit(Overloaded{
        [this](const msg::Planned& m) { onPlanned(m); },
        [this](const msg::Progress& m) { onProgress(m); },
        [this](const msg::Done& m) { onDone(m); },
        [this](const msg::Failed& m) { onFailed(m); },
        [this](const msg::Vanished& m) { onVanished(m); },
        [this](const msg::Prepared& m) { onPrepared(m); },
    }, message);
}

void Status::onPlanned(const msg::Planned& m) {
    if (session_) session_->append(m.item);
}

void Status::onProgress(const msg::Progress& m) {
    inflight_[m.seq] += m.bytes;
    sink_.reportProgress(m.bytes);
}

void Status::onDone(const msg::Done& m) {
    const auto& item = m.item;
    sink_.setTotal(item.totalCount, item.totalBytes);

    // bring the byte counter up to the item size whatever the reader reported
    uint64_t seen = 0;
    if (const auto it = inflight_.find(item.seq); it != inflight_.end()) {
        seen = it->second;
        inflight_.erase(it);
    }
    if (item.size() > seen) sink_.reportProgress(item.size() - seen);

    sink_.reportSuccess(item);
    ++outcome_.done;

    if (session_ && !item.replay) session_->markDone(item);
}

void Status::onFailed(const msg::Failed& m) {
    const auto& item = m.item;
    uint64_t partial = 0;
    if (const auto it = inflight_.find(item.seq); it != inflight_.end()) {
        partial = it->second;
        inflight_.erase(it);
    }
    sink_.setTotal(item.totalCount, item.totalBytes);
    sink_.reportError(item, partial);
    ++outcome_.failures;

    if (item.error && item.error->transient()) {
        ++outcome_.transient;
        if (session_) session_->keep();
    }

    Registry::sync()->debug("[Status] Item {} failed: {}", item.seq,
                            item.error ? item.error->describe() : std::string("unknown"));
}

void Status::onVanished(const msg::Vanished& m) {
    inflight_.erase(m.item.seq);
    ++outcome_.vanished;
    Registry::sync()->debug("[Status] Source vanished before copy, dropping {}", m.item.id());
}

void Status::onPrepared(const msg::Prepared& m) {
    outcome_.prepared = true;
    sink_.setTotal(m.totalCount, m.totalBytes);
    if (session_) session_->setPrepared(m.totalCount, m.totalBytes);
    Registry::sync()->debug("[Status] Planning finished: {} items, {} bytes", m.totalCount, m.totalBytes);
}
