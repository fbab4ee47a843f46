#include "storage/local/InotifyWatch.hpp"
#include "util/pathOrder.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

using namespace ms::storage;
using namespace ms::log;

namespace fs = std::filesystem;

namespace {

constexpr uint32_t WATCH_MASK = IN_CLOSE_WRITE | IN_MOVED_TO | IN_MOVED_FROM | IN_DELETE | IN_CREATE;

}

InotifyWatch::InotifyWatch(fs::path root, const bool recursive)
    : root_(std::move(root)), recursive_(recursive) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec))
        throw StorageError(ErrorKind::NotFound, root_.string(), "watch root is not a directory");

    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) throw StorageError(ErrorKind::IO, root_.string(),
                                    fmt::format("inotify_init1 failed: {}", std::strerror(errno)));

    addWatch("");
    if (recursive_) addTree("", false);

    // errors from the initial walk belong to the caller, not the event stream
    for (const auto& item : pending_)
        if (item.error) {
            const auto err = *item.error;
            ::close(fd_);
            throw StorageError(err);
        }

    Registry::watch()->debug("[InotifyWatch] Watching {} ({} directories)", root_.string(), dirs_.size());
}

InotifyWatch::~InotifyWatch() {
    if (fd_ >= 0) ::close(fd_);
}

void InotifyWatch::addWatch(const std::string& rel) {
    const auto p = rel.empty() ? root_ : root_ / rel;
    const int wd = inotify_add_watch(fd_, p.c_str(), WATCH_MASK);
    if (wd < 0) {
        // directory vanished before we got to it
        if (errno == ENOENT) return;
        pushError(ErrorKind::IO, rel, fmt::format("inotify_add_watch failed: {}", std::strerror(errno)));
        return;
    }
    dirs_[wd] = rel;
}

void InotifyWatch::addTree(const std::string& rel, const bool announceFiles) {
    const auto base = rel.empty() ? root_ : root_ / rel;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec) return;

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            pushError(ErrorKind::IO, rel, ec.message());
            return;
        }
        const auto childRel = fs::relative(it->path(), root_, ec).generic_string();
        if (ec) continue;

        std::error_code sec;
        if (it->is_directory(sec)) addWatch(childRel);
        else if (announceFiles && it->is_regular_file(sec))
            pending_.push_back({model::Event{model::EventType::Create, childRel, 0}, std::nullopt});
    }
}

void InotifyWatch::pushError(const ErrorKind kind, const std::string& path, std::string message) {
    pending_.push_back({std::nullopt, Error{kind, path, std::move(message)}});
}

std::optional<ms::storage::model::EventItem> InotifyWatch::poll(const std::chrono::milliseconds timeout) {
    if (pending_.empty()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno != EINTR)
            pushError(ErrorKind::IO, "", fmt::format("poll failed: {}", std::strerror(errno)));
        else if (rc > 0) drain();
    }

    if (pending_.empty()) return std::nullopt;
    auto item = std::move(pending_.front());
    pending_.pop_front();
    return item;
}

void InotifyWatch::drain() {
    alignas(inotify_event) char buffer[64 * 1024];

    while (true) {
        const ssize_t len = ::read(fd_, buffer, sizeof(buffer));
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) return;
            pushError(ErrorKind::IO, "", fmt::format("inotify read failed: {}", std::strerror(errno)));
            return;
        }
        if (len == 0) return;

        for (ssize_t off = 0; off < len;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buffer + off);
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

            if (ev->mask & IN_Q_OVERFLOW) {
                pushError(ErrorKind::Transport, "", "inotify event queue overflowed");
                continue;
            }

            if (ev->mask & IN_IGNORED) {
                dirs_.erase(ev->wd);
                continue;
            }

            const auto dir = dirs_.find(ev->wd);
            if (dir == dirs_.end() || ev->len == 0) continue;

            const auto rel = util::joinPath(dir->second, ev->name);

            if (ev->mask & IN_ISDIR) {
                if (recursive_ && (ev->mask & (IN_CREATE | IN_MOVED_TO))) {
                    addWatch(rel);
                    addTree(rel, true); // files created before the watch was armed
                }
                continue;
            }

            if (ev->mask & (IN_CLOSE_WRITE | IN_MOVED_TO))
                pending_.push_back({model::Event{model::EventType::Create, rel, 0}, std::nullopt});
            else if (ev->mask & (IN_DELETE | IN_MOVED_FROM))
                pending_.push_back({model::Event{model::EventType::Remove, rel, 0}, std::nullopt});
        }
    }
}
