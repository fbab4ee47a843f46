#include "sync/model/WorkItem.hpp"
#include "util/pathOrder.hpp"

#include <nlohmann/json.hpp>

namespace ms::sync::model {

std::string Endpoint::url() const {
    return util::joinPath(location.resolved, entry.path);
}

std::string WorkItem::id() const {
    if (source) return source->url();
    return target.url();
}

WorkItem WorkItem::copy(Endpoint source, Endpoint target, const size_t targetIndex) {
    WorkItem item;
    item.source = std::move(source);
    item.target = std::move(target);
    item.targetIndex = targetIndex;
    return item;
}

WorkItem WorkItem::remove(Endpoint target, const size_t targetIndex) {
    WorkItem item;
    item.target = std::move(target);
    item.targetIndex = targetIndex;
    return item;
}

WorkItem WorkItem::failure(storage::Error error, const size_t targetIndex, std::optional<Endpoint> source,
                           std::optional<Endpoint> target) {
    WorkItem item;
    item.error = std::move(error);
    item.source = std::move(source);
    if (target) item.target = std::move(*target);
    item.targetIndex = targetIndex;
    return item;
}

void Tally::stamp(WorkItem& item) {
    item.seq = ++seq_;
    if (item.error) {
        item.totalCount = count_.load();
        item.totalBytes = bytes_.load();
        return;
    }
    item.totalCount = ++count_;
    item.totalBytes = bytes_.fetch_add(item.size()) + item.size();
}

void Tally::restore(const uint64_t seq, const uint64_t count, const uint64_t bytes) {
    seq_ = seq;
    count_ = count;
    bytes_ = bytes;
}

void to_json(nlohmann::json& j, const Endpoint& e) {
    j = {
        {"location", e.location},
        {"entry", e.entry}
    };
}

void from_json(const nlohmann::json& j, Endpoint& e) {
    j.at("location").get_to(e.location);
    j.at("entry").get_to(e.entry);
}

void to_json(nlohmann::json& j, const WorkItem& w) {
    j = {
        {"seq", w.seq},
        {"target", w.target},
        {"target_index", w.targetIndex},
        {"total_count", w.totalCount},
        {"total_bytes", w.totalBytes}
    };
    if (w.source) j["source"] = *w.source;
    if (w.error) j["error"] = *w.error;
}

void from_json(const nlohmann::json& j, WorkItem& w) {
    w.seq = j.at("seq").get<uint64_t>();
    j.at("target").get_to(w.target);
    w.targetIndex = j.value("target_index", size_t{0});
    w.totalCount = j.value("total_count", uint64_t{0});
    w.totalBytes = j.value("total_bytes", uint64_t{0});
    if (j.contains("source")) w.source = j.at("source").get<Endpoint>();
    if (j.contains("error")) w.error = j.at("error").get<storage::Error>();
}

}
