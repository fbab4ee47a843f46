#include "sync/Session.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <ctime>
#include <stdexcept>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::log;

namespace {

constexpr unsigned int HEADER_SAVE_INTERVAL = 64;

}

namespace ms::sync {

void to_json(nlohmann::json& j, const SessionHeader& h) {
    j = {
        {"version", h.version},
        {"id", h.id},
        {"created", h.created},
        {"source", h.source},
        {"targets", h.targets},
        {"force", h.force},
        {"fake", h.fake},
        {"remove", h.remove},
        {"prepared", h.prepared},
        {"total_objects", h.totalObjects},
        {"total_bytes", h.totalBytes},
        {"last_copied", h.lastCopied}
    };
}

void from_json(const nlohmann::json& j, SessionHeader& h) {
    h.version = j.value("version", 1);
    h.id = j.at("id").get<std::string>();
    h.created = j.value("created", "");
    h.source = j.at("source").get<std::string>();
    h.targets = j.at("targets").get<std::vector<std::string>>();
    h.force = j.value("force", false);
    h.fake = j.value("fake", false);
    h.remove = j.value("remove", false);
    h.prepared = j.value("prepared", false);
    h.totalObjects = j.value("total_objects", uint64_t{0});
    h.totalBytes = j.value("total_bytes", uint64_t{0});
    h.lastCopied = j.value("last_copied", "");
}

}

Session::Session(fs::path dir, SessionHeader header) : dir_(std::move(dir)), header_(std::move(header)) {}

std::string Session::makeId(const std::string& source, const std::vector<std::string>& targets, const Policy& policy) {
    std::string key = "mirror\n" + source;
    for (const auto& t : targets) key += "\n" + t;
    key += fmt::format("\nforce={} fake={} remove={}", policy.force, policy.fake, policy.remove);
    return util::sha256Hex(key).substr(0, 32);
}

bool Session::exists(const fs::path& dir, const std::string& id) {
    std::error_code ec;
    return fs::exists(dir / (id + ".json"), ec);
}

std::unique_ptr<Session> Session::create(const fs::path& dir, SessionHeader header) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error(fmt::format("Failed to create session directory {}: {}", dir.string(), ec.message()));

    if (header.created.empty()) header.created = util::timestampToString(std::time(nullptr));

    std::unique_ptr<Session> s(new Session(dir, std::move(header)));
    // fresh logs, a leftover from a crashed run must not leak in
    fs::remove(s->dataPath(), ec);
    fs::remove(s->donePath(), ec);
    s->openLogs();
    s->save();

    Registry::session()->debug("[Session] Created {} in {}", s->header_.id, dir.string());
    return s;
}

std::unique_ptr<Session> Session::load(const fs::path& dir, const std::string& id) {
    if (!exists(dir, id)) return nullptr;

    SessionHeader header;
    {
        std::ifstream in(dir / (id + ".json"));
        if (!in) throw std::runtime_error(fmt::format("Failed to open session header {}", id));
        try {
            header = nlohmann::json::parse(in).get<SessionHeader>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(fmt::format("Corrupt session header {}: {}", id, e.what()));
        }
    }

    std::unique_ptr<Session> s(new Session(dir, std::move(header)));

    if (std::ifstream data(s->dataPath()); data) {
        std::string line;
        size_t lineNo = 0;
        while (std::getline(data, line)) {
            ++lineNo;
            if (line.empty()) continue;
            try {
                auto item = nlohmann::json::parse(line).get<WorkItem>();
                s->maxSeq_ = std::max(s->maxSeq_, item.seq);
                s->planned_.push_back(std::move(item));
            } catch (const nlohmann::json::exception& e) {
                // a torn final line from an abrupt exit
                Registry::session()->warn("[Session] Skipping unreadable entry {} in {}: {}", lineNo, id, e.what());
            }
        }
    }

    if (std::ifstream done(s->donePath()); done) {
        uint64_t seq = 0;
        while (done >> seq) s->completed_.insert(seq);
    }

    s->openLogs();
    Registry::session()->debug("[Session] Loaded {} with {} planned and {} completed items",
                               id, s->planned_.size(), s->completed_.size());
    return s;
}

void Session::openLogs() {
    data_.open(dataPath(), std::ios::app);
    done_.open(donePath(), std::ios::app);
    if (!data_ || !done_) throw std::runtime_error(fmt::format("Failed to open session logs for {}", header_.id));
}

void Session::append(const WorkItem& item) {
    data_ << nlohmann::json(item).dump() << '\n';
    data_.flush();
    if (!data_) throw std::runtime_error(fmt::format("Failed to append to session log {}", header_.id));
    maxSeq_ = std::max(maxSeq_, item.seq);
}

void Session::markDone(const WorkItem& item) {
    if (!completed_.insert(item.seq).second) return;
    done_ << item.seq << '\n';
    done_.flush();
    if (!done_) throw std::runtime_error(fmt::format("Failed to append to session completion log {}", header_.id));

    header_.lastCopied = item.id();
    if (++sinceSave_ >= HEADER_SAVE_INTERVAL) save();
}

void Session::setPrepared(const uint64_t totalObjects, const uint64_t totalBytes) {
    header_.prepared = true;
    header_.totalObjects = totalObjects;
    header_.totalBytes = totalBytes;
    save();
}

void Session::save() {
    if (removed_) return;
    sinceSave_ = 0;

    const auto target = headerPath();
    const auto tmp = dir_ / (header_.id + ".json.tmp");
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << nlohmann::json(header_).dump(2) << '\n';
        out.flush();
        if (!out) throw std::runtime_error(fmt::format("Failed to write session header {}", tmp.string()));
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) throw std::runtime_error(fmt::format("Failed to save session {}: {}", header_.id, ec.message()));
}

void Session::remove() {
    data_.close();
    done_.close();
    removed_ = true;

    std::error_code ec;
    for (const auto& p : {headerPath(), dataPath(), donePath()}) {
        fs::remove(p, ec);
        if (ec) Registry::session()->warn("[Session] Failed to remove {}: {}", p.string(), ec.message());
    }
    Registry::session()->debug("[Session] Removed {}", header_.id);
}

std::vector<WorkItem> Session::items() const {
    std::vector<WorkItem> out = planned_;
    for (auto& item : out) item.replay = completed_.contains(item.seq);
    return out;
}
