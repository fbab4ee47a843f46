#pragma once

#include "sync/model/Policy.hpp"
#include "sync/model/WorkItem.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ms::sync {

namespace fs = std::filesystem;

struct SessionHeader {
    int version = 1;
    std::string id;
    std::string created;
    std::string source;
    std::vector<std::string> targets;
    bool force = false;
    bool fake = false;
    bool remove = false;
    bool prepared = false;
    uint64_t totalObjects = 0;
    uint64_t totalBytes = 0;
    std::string lastCopied;
};

void to_json(nlohmann::json& j, const SessionHeader& h);
void from_json(const nlohmann::json& j, SessionHeader& h);

// Resumable record of a one-shot mirror. Three files under dir:
//   <id>.json  header, rewritten atomically
//   <id>.data  one planned WorkItem per line, append-only
//   <id>.done  one completed seq per line, append-only
class Session {
public:
    static std::string makeId(const std::string& source, const std::vector<std::string>& targets,
                              const model::Policy& policy);

    [[nodiscard]] static bool exists(const fs::path& dir, const std::string& id);

    // Throws std::runtime_error when the directory or files cannot be created.
    static std::unique_ptr<Session> create(const fs::path& dir, SessionHeader header);

    // nullptr when no session with this id exists.
    static std::unique_ptr<Session> load(const fs::path& dir, const std::string& id);

    void append(const model::WorkItem& item);
    void markDone(const model::WorkItem& item);
    void setPrepared(uint64_t totalObjects, uint64_t totalBytes);

    void save();
    void remove();

    // Planned items in log order; completed ones come back with replay set.
    [[nodiscard]] std::vector<model::WorkItem> items() const;

    [[nodiscard]] const SessionHeader& header() const { return header_; }
    [[nodiscard]] const std::unordered_set<uint64_t>& completed() const { return completed_; }
    [[nodiscard]] uint64_t maxSeq() const { return maxSeq_; }
    [[nodiscard]] bool isCompleted(const uint64_t seq) const { return completed_.contains(seq); }

    // A transient failure happened; the session outlives the run.
    void keep() { keep_ = true; }
    [[nodiscard]] bool kept() const { return keep_; }

    [[nodiscard]] fs::path headerPath() const { return dir_ / (header_.id + ".json"); }
    [[nodiscard]] fs::path dataPath() const { return dir_ / (header_.id + ".data"); }
    [[nodiscard]] fs::path donePath() const { return dir_ / (header_.id + ".done"); }

private:
    Session(fs::path dir, SessionHeader header);

    fs::path dir_;
    SessionHeader header_;
    std::ofstream data_;
    std::ofstream done_;
    std::vector<model::WorkItem> planned_;
    std::unordered_set<uint64_t> completed_;
    uint64_t maxSeq_ = 0;
    unsigned int sinceSave_ = 0;
    bool keep_ = false;
    bool removed_ = false;

    void openLogs();
};

}
