#pragma once

#include "storage/Client.hpp"

#include <deque>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace ms::storage {

// Linux inotify subscription over a directory tree. Files report Create once
// their writer closes them (or they are moved in); new directories are
// watched and scanned so files that landed before the watch are not missed.
class InotifyWatch final : public Subscription {
public:
    InotifyWatch(std::filesystem::path root, bool recursive);
    ~InotifyWatch() override;

    InotifyWatch(const InotifyWatch&) = delete;
    InotifyWatch& operator=(const InotifyWatch&) = delete;

    std::optional<model::EventItem> poll(std::chrono::milliseconds timeout) override;

    [[nodiscard]] size_t watchCount() const { return dirs_.size(); }

private:
    std::filesystem::path root_;
    bool recursive_;
    int fd_ = -1;
    std::unordered_map<int, std::string> dirs_; // wd -> rel dir
    std::deque<model::EventItem> pending_;

    void addWatch(const std::string& rel);
    void addTree(const std::string& rel, bool announceFiles);
    void drain();
    void pushError(ErrorKind kind, const std::string& path, std::string message);
};

}
