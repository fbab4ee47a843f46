#include "storage/local/LocalClient.hpp"
#include "storage/local/InotifyWatch.hpp"
#include "util/pathOrder.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <random>
#include <variant>
#include <vector>

using namespace ms::storage;
using namespace ms::log;

namespace {

std::optional<std::time_t> mtimeOf(const fs::path& p) {
    std::error_code ec;
    const auto ft = fs::last_write_time(p, ec);
    if (ec) return std::nullopt;
    return std::chrono::system_clock::to_time_t(std::chrono::file_clock::to_sys(ft));
}

struct Child {
    std::string name;
    bool isDir = false;
    uint64_t size = 0;
    std::optional<std::time_t> mtime{};
    std::optional<Error> error{};
};

std::variant<std::vector<Child>, Error> readDir(const fs::path& dir, const std::string& rel) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return Error{ec == std::errc::no_such_file_or_directory ? ErrorKind::NotFound : ErrorKind::IO,
                         rel, ec.message()};

    std::vector<Child> children;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) return Error{ErrorKind::IO, rel, ec.message()};

        Child c;
        c.name = it->path().filename().string();
        const auto childRel = ms::util::joinPath(rel, c.name);

        std::error_code sec;
        const auto st = it->status(sec);
        if (sec || st.type() == fs::file_type::not_found) {
            c.error = Error{ErrorKind::IO, childRel, sec ? sec.message() : "dangling symbolic link"};
        } else if (fs::is_directory(st)) {
            c.isDir = true;
            c.mtime = mtimeOf(it->path());
        } else if (fs::is_regular_file(st)) {
            c.size = it->file_size(sec);
            if (sec) c.error = Error{ErrorKind::IO, childRel, sec.message()};
            c.mtime = mtimeOf(it->path());
        } else {
            continue; // sockets, fifos, devices
        }
        children.push_back(std::move(c));
    }

    std::ranges::sort(children, [](const Child& a, const Child& b) { return a.name < b.name; });
    return children;
}

class LocalLister final : public Lister {
public:
    LocalLister(fs::path root, std::string rel, const bool recursive, const bool includeDirs)
        : root_(std::move(root)), rel_(std::move(rel)), recursive_(recursive), includeDirs_(includeDirs) {}

    std::optional<ListItem> next() override {
        if (!started_) {
            started_ = true;
            if (auto first = start()) return first;
        }

        if (!pending_.empty()) {
            auto item = std::move(pending_.back());
            pending_.pop_back();
            return item;
        }

        while (!stack_.empty()) {
            auto& frame = stack_.back();
            if (frame.idx >= frame.children.size()) {
                stack_.pop_back();
                continue;
            }

            auto& child = frame.children[frame.idx++];
            if (child.error) return ListItem{std::nullopt, std::move(child.error)};

            model::Entry entry;
            entry.path = ms::util::joinPath(frame.rel, child.name);
            entry.size = child.size;
            entry.isDir = child.isDir;
            entry.mtime = child.mtime;

            if (entry.isDir && recursive_) {
                // frame reference is invalidated by the push
                if (!descend(entry.path) && !includeDirs_) {
                    auto item = std::move(pending_.back());
                    pending_.pop_back();
                    return item;
                }
            }

            if (entry.isDir && !includeDirs_) continue;
            return ListItem{std::move(entry), std::nullopt};
        }

        return std::nullopt;
    }

private:
    struct Frame {
        std::string rel;
        std::vector<Child> children;
        size_t idx = 0;
    };

    fs::path root_;
    std::string rel_;
    bool recursive_;
    bool includeDirs_;
    bool started_ = false;
    std::vector<Frame> stack_;
    std::vector<ListItem> pending_;

    std::optional<ListItem> start() {
        const auto p = rel_.empty() ? root_ : root_ / rel_;
        std::error_code ec;
        const auto st = fs::status(p, ec);
        if (!fs::exists(st))
            return ListItem{std::nullopt, Error{ErrorKind::NotFound, rel_, "no such file or directory"}};
        if (ec) return ListItem{std::nullopt, Error{ErrorKind::IO, rel_, ec.message()}};

        if (!fs::is_directory(st)) {
            model::Entry entry;
            entry.path = rel_;
            entry.size = fs::file_size(p, ec);
            entry.mtime = mtimeOf(p);
            if (ec) return ListItem{std::nullopt, Error{ErrorKind::IO, rel_, ec.message()}};
            return ListItem{std::move(entry), std::nullopt};
        }

        auto res = readDir(p, rel_);
        if (auto* err = std::get_if<Error>(&res)) return ListItem{std::nullopt, std::move(*err)};
        stack_.push_back(Frame{rel_, std::move(std::get<std::vector<Child>>(res)), 0});
        return std::nullopt;
    }

    // Returns false and queues an error item when the directory cannot be read.
    bool descend(const std::string& rel) {
        auto res = readDir(root_ / rel, rel);
        if (auto* err = std::get_if<Error>(&res)) {
            pending_.push_back(ListItem{std::nullopt, std::move(*err)});
            return false;
        }
        stack_.push_back(Frame{rel, std::move(std::get<std::vector<Child>>(res)), 0});
        return true;
    }
};

std::string tempSuffix() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return fmt::format(".mirrorsync-{:016x}.part", rng());
}

}

LocalClient::LocalClient(Location location)
    : Client(std::move(location)), root_(location_.resolved) {}

fs::path LocalClient::absPath(const std::string& rel) const {
    return rel.empty() ? root_ : root_ / rel;
}

std::unique_ptr<Lister> LocalClient::list(const std::string& rel, const bool recursive, const bool includeDirs) const {
    return std::make_unique<LocalLister>(root_, util::normalizeRel(rel), recursive, includeDirs);
}

ms::storage::model::Entry LocalClient::stat(const std::string& rel) const {
    const auto p = absPath(rel);
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (!fs::exists(st)) throw StorageError(ErrorKind::NotFound, rel, "no such file or directory");
    if (ec) throw StorageError(ErrorKind::IO, rel, ec.message());

    model::Entry entry;
    entry.path = rel;
    entry.isDir = fs::is_directory(st);
    if (!entry.isDir) {
        entry.size = fs::file_size(p, ec);
        if (ec) throw StorageError(ErrorKind::IO, rel, ec.message());
    }
    entry.mtime = mtimeOf(p);
    return entry;
}

std::unique_ptr<std::istream> LocalClient::get(const std::string& rel) const {
    const auto p = absPath(rel);
    std::error_code ec;
    const auto st = fs::status(p, ec);
    if (!fs::exists(st)) throw StorageError(ErrorKind::NotFound, rel, "no such file or directory");
    if (fs::is_directory(st)) throw StorageError(ErrorKind::InvalidArgument, rel, "is a directory");

    auto in = std::make_unique<std::ifstream>(p, std::ios::binary);
    if (!*in) throw StorageError(ErrorKind::IO, rel, "failed to open for reading");
    return in;
}

void LocalClient::put(const std::string& rel, const uint64_t sizeHint, std::istream& in) const {
    const auto p = absPath(rel);
    std::error_code ec;

    if (fs::is_directory(p, ec)) throw StorageError(ErrorKind::InvalidTarget, rel, "target is a directory");

    fs::create_directories(p.parent_path(), ec);
    if (ec) throw StorageError(ErrorKind::IO, rel, fmt::format("failed to create parent directory: {}", ec.message()));

    const auto tmp = p.parent_path() / ("." + p.filename().string() + tempSuffix());
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw StorageError(ErrorKind::IO, rel, "failed to open for writing");

        std::vector<char> buf(256 * 1024);
        uint64_t written = 0;
        while (in) {
            in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            const auto n = in.gcount();
            if (n <= 0) break;
            out.write(buf.data(), n);
            written += static_cast<uint64_t>(n);
            if (!out) break;
        }

        if (in.bad() || !out.flush()) {
            out.close();
            fs::remove(tmp, ec);
            throw StorageError(ErrorKind::IO, rel, in.bad() ? "read from source failed" : "write failed");
        }

        if (written != sizeHint)
            Registry::storage()->debug("[LocalClient] {} wrote {} bytes, expected {}", rel, written, sizeHint);
    }

    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmp, rmEc);
        throw StorageError(ErrorKind::IO, rel, fmt::format("failed to move into place: {}", ec.message()));
    }
}

void LocalClient::remove(const std::string& rel) const {
    const auto p = absPath(rel);
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(p, ec))) throw StorageError(ErrorKind::NotFound, rel, "no such file or directory");
    fs::remove(p, ec);
    if (ec) throw StorageError(ErrorKind::IO, rel, ec.message());
}

std::unique_ptr<Subscription> LocalClient::subscribe(const bool recursive) const {
    return std::make_unique<InotifyWatch>(root_, recursive);
}
