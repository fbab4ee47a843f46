#include "progress/JsonSink.hpp"

#include <ostream>
#include <nlohmann/json.hpp>

using namespace ms::progress;
using namespace ms::sync::model;

JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::onSuccess(const WorkItem& item, const Summary&) {
    nlohmann::json j = {
        {"status", "success"},
        {"target", item.target.url()},
        {"size", item.size()},
        {"totalCount", item.totalCount},
        {"totalSize", item.totalBytes}
    };
    if (item.source) j["source"] = item.source->url();
    else j["operation"] = "remove";
    out_ << j.dump() << std::endl;
}

void JsonSink::onError(const WorkItem& item, const Summary&) {
    nlohmann::json j = {{"status", "error"}};
    if (item.error) {
        j["path"] = item.error->path.empty() ? item.id() : item.error->path;
        j["error"] = {
            {"kind", std::string(storage::to_string(item.error->kind))},
            {"message", item.error->message}
        };
    } else {
        j["path"] = item.id();
    }
    out_ << j.dump() << std::endl;
}

void JsonSink::onMessage(const std::string& text) {
    out_ << nlohmann::json{{"status", "info"}, {"message", text}}.dump() << std::endl;
}

void JsonSink::onFinish(const Summary& s) {
    out_ << nlohmann::json{
        {"status", "summary"},
        {"objects", s.objects},
        {"bytes", s.bytes},
        {"errors", s.errors},
        {"totalCount", s.totalObjects},
        {"totalSize", s.totalBytes},
        {"elapsedMs", s.elapsed.count()}
    }.dump() << std::endl;
}
