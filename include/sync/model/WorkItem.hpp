#pragma once

#include "storage/Error.hpp"
#include "storage/Location.hpp"
#include "storage/model/Entry.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ms::sync::model {

struct Endpoint {
    storage::Location location;
    storage::model::Entry entry;

    [[nodiscard]] std::string url() const;
};

// One queued copy or delete. Consumers must look at error first: an error
// item makes no promise about its endpoints.
struct WorkItem {
    uint64_t seq = 0;
    std::optional<Endpoint> source{};   // absent for deletes
    Endpoint target;
    size_t targetIndex = 0;
    uint64_t totalCount = 0;
    uint64_t totalBytes = 0;
    std::optional<storage::Error> error{};
    bool replay = false;                // already completed in a resumed session

    [[nodiscard]] bool isCopy() const { return !error && source.has_value(); }
    [[nodiscard]] bool isDelete() const { return !error && !source.has_value(); }
    [[nodiscard]] uint64_t size() const { return source ? source->entry.size : 0; }

    // Stable identifier recorded as the session's last-completed marker.
    [[nodiscard]] std::string id() const;

    static WorkItem copy(Endpoint source, Endpoint target, size_t targetIndex);
    static WorkItem remove(Endpoint target, size_t targetIndex);
    static WorkItem failure(storage::Error error, size_t targetIndex, std::optional<Endpoint> source = std::nullopt,
                            std::optional<Endpoint> target = std::nullopt);
};

// Running totals shared by every producer. Stamping hands out the sequence
// number and advances the totals for items that will do work.
class Tally {
public:
    void stamp(WorkItem& item);

    [[nodiscard]] uint64_t count() const { return count_.load(); }
    [[nodiscard]] uint64_t bytes() const { return bytes_.load(); }

    // Resumed sessions continue numbering after the logged items.
    void restore(uint64_t seq, uint64_t count, uint64_t bytes);

private:
    std::atomic<uint64_t> seq_{0};
    std::atomic<uint64_t> count_{0};
    std::atomic<uint64_t> bytes_{0};
};

void to_json(nlohmann::json& j, const Endpoint& e);
void from_json(const nlohmann::json& j, Endpoint& e);
void to_json(nlohmann::json& j, const WorkItem& w);
void from_json(const nlohmann::json& j, WorkItem& w);

}
