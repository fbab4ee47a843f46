#include "storage/s3/S3Client.hpp"
#include "util/pathOrder.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>
#include <variant>
#include <pugixml.hpp>

using namespace ms::storage;
using namespace ms::util;
using namespace ms::log;

namespace ms::storage::s3 {

ListPage parseListPage(const std::string& xml) {
    pugi::xml_document doc;
    if (const auto res = doc.load_buffer(xml.data(), xml.size()); !res)
        throw StorageError(ErrorKind::IO, "", fmt::format("malformed list response: {}", res.description()));

    const auto root = doc.child("ListBucketResult");
    if (!root) throw StorageError(ErrorKind::IO, "", "list response has no ListBucketResult");

    ListPage page;
    page.truncated = std::string(root.child_value("IsTruncated")) == "true";
    page.nextToken = root.child_value("NextContinuationToken");

    for (auto contents = root.child("Contents"); contents; contents = contents.next_sibling("Contents")) {
        model::Entry entry;
        entry.path = contents.child_value("Key");
        const std::string size = contents.child_value("Size");
        entry.size = size.empty() ? 0 : std::stoull(size);
        entry.mtime = parseIsoTimestamp(contents.child_value("LastModified"));
        if (const std::string etag = contents.child_value("ETag"); !etag.empty()) entry.version = etag;
        page.objects.push_back(std::move(entry));
    }

    for (auto cp = root.child("CommonPrefixes"); cp; cp = cp.next_sibling("CommonPrefixes"))
        page.prefixes.emplace_back(cp.child_value("Prefix"));

    if (page.truncated && page.nextToken.empty())
        throw StorageError(ErrorKind::IO, "", "truncated list response without continuation token");

    return page;
}

}

std::pair<std::vector<ms::storage::model::Entry>, std::vector<std::string>>
S3Client::listLevel(const std::string& dirPrefix) const {
    std::vector<model::Entry> objects;
    std::vector<std::string> prefixes;
    std::string continuationToken;

    do {
        std::map<std::string, std::string> params{{"list-type", "2"}, {"delimiter", "/"}};
        if (!dirPrefix.empty()) params["prefix"] = dirPrefix;
        if (!continuationToken.empty()) params["continuation-token"] = continuationToken;
        const auto query = canonicalQueryString(params);

        const auto [canonicalPath, url] = constructPaths("", query);
        const auto hdrs = makeSigHeaders("GET", canonicalPath, "UNSIGNED-PAYLOAD", query);

        const HttpResponse resp = performCurl([&](CURL* h) {
            curl_easy_setopt(h, CURLOPT_URL, url.c_str());
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        });

        if (!resp.ok()) {
            Registry::cloud()->error("[S3Client] listObjects failed: CURL={} HTTP={} Response:\n{}",
                                     static_cast<int>(resp.curl), resp.http, resp.body);
            throw StorageError(responseError(resp, dirPrefix, "list"));
        }

        auto page = s3::parseListPage(resp.body);
        std::ranges::move(page.objects, std::back_inserter(objects));
        std::ranges::move(page.prefixes, std::back_inserter(prefixes));
        continuationToken = page.truncated ? page.nextToken : std::string{};
    } while (!continuationToken.empty());

    return {std::move(objects), std::move(prefixes)};
}

namespace {

struct Child {
    std::string name;
    model::Entry entry;
};

// Depth-first walk over delimiter listings, one level fetched at a time.
class S3Lister final : public Lister {
public:
    S3Lister(const S3Client& client, std::string rel, const bool recursive, const bool includeDirs)
        : client_(client), rel_(std::move(rel)), recursive_(recursive), includeDirs_(includeDirs) {}

    std::optional<ListItem> next() override {
        if (!started_) {
            started_ = true;
            auto level = fetch(rel_);
            if (auto* err = std::get_if<Error>(&level)) return ListItem{std::nullopt, std::move(*err)};
            auto& children = std::get<std::vector<Child>>(level);
            if (children.empty() && (!rel_.empty() || !client_.prefix().empty())) {
                // an empty prefix is indistinguishable from a missing one
                return ListItem{std::nullopt, Error{ErrorKind::NotFound, rel_, "no such prefix"}};
            }
            stack_.push_back(Frame{std::move(children), 0});
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

            auto entry = std::move(frame.children[frame.idx++].entry);

            if (entry.isDir && recursive_) {
                auto level = fetch(entry.path);
                if (auto* err = std::get_if<Error>(&level)) pending_.push_back(ListItem{std::nullopt, std::move(*err)});
                else stack_.push_back(Frame{std::move(std::get<std::vector<Child>>(level)), 0});
            }

            if (entry.isDir && !includeDirs_) {
                if (!pending_.empty()) {
                    auto item = std::move(pending_.back());
                    pending_.pop_back();
                    return item;
                }
                continue;
            }
            return ListItem{std::move(entry), std::nullopt};
        }

        return std::nullopt;
    }

private:
    struct Frame {
        std::vector<Child> children;
        size_t idx = 0;
    };

    const S3Client& client_;
    std::string rel_;
    bool recursive_;
    bool includeDirs_;
    bool started_ = false;
    std::vector<Frame> stack_;
    std::vector<ListItem> pending_;

    std::variant<std::vector<Child>, Error> fetch(const std::string& rel) const {
        const auto base = joinPath(client_.prefix(), rel);
        const auto dirPrefix = base.empty() ? std::string{} : base + "/";

        try {
            auto [objects, prefixes] = client_.listLevel(dirPrefix);

            std::vector<Child> children;
            children.reserve(objects.size() + prefixes.size());

            for (auto& obj : objects) {
                auto name = obj.path.substr(dirPrefix.size());
                if (name.empty() || name.back() == '/') continue; // directory marker
                obj.path = joinPath(rel, name);
                children.push_back(Child{std::move(name), std::move(obj)});
            }

            for (const auto& p : prefixes) {
                auto name = normalizeRel(p.substr(dirPrefix.size()));
                if (name.empty()) continue;
                children.push_back(Child{name, model::Entry{joinPath(rel, name), 0, true, std::nullopt, std::nullopt}});
            }

            std::ranges::stable_sort(children, [](const Child& a, const Child& b) { return a.name < b.name; });
            return children;
        } catch (const StorageError& e) {
            // listing errors name the relative directory that could not be read
            auto err = e.error();
            err.path = rel;
            return err;
        }
    }
};

}

std::unique_ptr<Lister> S3Client::list(const std::string& rel, const bool recursive, const bool includeDirs) const {
    return std::make_unique<S3Lister>(*this, normalizeRel(rel), recursive, includeDirs);
}
