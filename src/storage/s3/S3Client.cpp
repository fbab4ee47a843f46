#include "storage/s3/S3Client.hpp"
#include "util/pathOrder.hpp"
#include "util/s3Helpers.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <utility>

using namespace ms::storage;
using namespace ms::util;
using namespace ms::log;

namespace ms::storage {

Error responseError(const HttpResponse& resp, const std::string& path, const std::string_view op) {
    if (resp.curl != CURLE_OK) {
        const auto msg = fmt::format("{} failed: {}", op, curl_easy_strerror(resp.curl));
        switch (resp.curl) {
            case CURLE_OPERATION_TIMEDOUT:
            case CURLE_COULDNT_CONNECT:
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_SEND_ERROR:
            case CURLE_RECV_ERROR:
            case CURLE_GOT_NOTHING:
            case CURLE_PARTIAL_FILE:
            case CURLE_SSL_CONNECT_ERROR:
                return {ErrorKind::Transport, path, msg};
            default:
                return {ErrorKind::IO, path, msg};
        }
    }

    const auto msg = fmt::format("{} failed (HTTP {})", op, resp.http);
    if (resp.http == 404) return {ErrorKind::NotFound, path, msg};
    if (resp.http == 401 || resp.http == 403) return {ErrorKind::Auth, path, msg};
    if (resp.http == 501) return {ErrorKind::NotImplemented, path, msg};
    if (resp.http >= 500) return {ErrorKind::Transport, path, msg};
    return {ErrorKind::IO, path, msg};
}

}

S3Client::S3Client(Location location, config::AliasConfig alias, const config::MirrorConfig& mirror)
    : Client(std::move(location)), alias_(std::move(alias)),
      multipartThreshold_(std::max<uintmax_t>(mirror.multipart_threshold_bytes, MIN_PART_SIZE)),
      partSize_(std::max<uintmax_t>(mirror.part_size_bytes, MIN_PART_SIZE)) {
    const auto path = normalizeRel(location_.path);
    const auto slash = path.find('/');
    bucket_ = path.substr(0, slash);
    if (slash != std::string::npos) prefix_ = path.substr(slash + 1);
    if (bucket_.empty()) throw StorageError(ErrorKind::InvalidArgument, location_.path, "missing bucket name");
    if (alias_.url.find("//") == std::string::npos)
        throw StorageError(ErrorKind::InvalidArgument, alias_.url, "alias url needs a scheme");
    ensureCurlGlobalInit();
}

std::string S3Client::keyFor(const std::string& rel) const {
    return joinPath(prefix_, normalizeRel(rel));
}

std::map<std::string, std::string> S3Client::buildHeaderMap(const std::string& payloadHash) const {
    return {
                {"host", alias_.url.substr(alias_.url.find("//") + 2)},
                {"x-amz-content-sha256", payloadHash},
                {"x-amz-date", getCurrentTimestamp()}
    };
}

std::pair<std::string, std::string> S3Client::constructPaths(const std::string& key, const std::string& query) const {
    auto canonicalPath = "/" + bucket_;
    if (!key.empty()) canonicalPath += "/" + escapeKeyPreserveSlashes(key);
    auto url = alias_.url + canonicalPath;
    if (!query.empty()) url += "?" + query;
    return {canonicalPath, url};
}

SList S3Client::makeSigHeaders(const std::string& method,
                               const std::string& canonical,
                               const std::string& payloadHash,
                               const std::string& query) const {
    auto base = buildHeaderMap(payloadHash);      // host + dates
    const auto auth = buildAuthorizationHeader(alias_, method, canonical, base, payloadHash, query);

    SList out;
    out.add("Authorization: " + auth);
    for (auto& [k, v] : base) out.add(k + ": " + v);
    return out;  // RAII slist
}

// ##### Metadata #####

ms::storage::model::Entry S3Client::stat(const std::string& rel) const {
    const auto cleanRel = normalizeRel(rel);
    const auto key = keyFor(cleanRel);

    if (cleanRel.empty()) {
        // bucket root exists whenever the bucket answers; a prefix needs at least one key below it
        if (!prefixExists(prefix_.empty() ? "" : prefix_ + "/") && !prefix_.empty())
            throw StorageError(ErrorKind::NotFound, cleanRel, "prefix does not exist");
        return model::Entry{cleanRel, 0, true, std::nullopt, std::nullopt};
    }

    const auto [canonicalPath, url] = constructPaths(key);
    const auto hdrs = makeSigHeaders("HEAD", canonicalPath, "UNSIGNED-PAYLOAD");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_NOBODY, 1L);            // HEAD request
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (resp.ok()) {
        const auto headers = parseHeaders(resp.hdr);
        model::Entry entry;
        entry.path = cleanRel;
        if (const auto it = headers.find("content-length"); it != headers.end())
            entry.size = std::stoull(it->second);
        if (const auto it = headers.find("last-modified"); it != headers.end())
            entry.mtime = parseHttpDate(it->second);
        if (const auto it = headers.find("etag"); it != headers.end())
            entry.version = it->second;
        return entry;
    }

    if (resp.curl == CURLE_OK && resp.http == 404) {
        if (prefixExists(key + "/")) return model::Entry{cleanRel, 0, true, std::nullopt, std::nullopt};
        throw StorageError(ErrorKind::NotFound, cleanRel, "object does not exist");
    }

    Registry::cloud()->debug("[S3Client] HEAD {} failed: CURL={} HTTP={}", key, static_cast<int>(resp.curl), resp.http);
    throw StorageError(responseError(resp, cleanRel, "stat"));
}

bool S3Client::prefixExists(const std::string& dirPrefix) const {
    std::map<std::string, std::string> params{{"list-type", "2"}, {"max-keys", "1"}};
    if (!dirPrefix.empty()) params["prefix"] = dirPrefix;
    const auto query = canonicalQueryString(params);

    const auto [canonicalPath, url] = constructPaths("", query);
    const auto hdrs = makeSigHeaders("GET", canonicalPath, "UNSIGNED-PAYLOAD", query);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) throw StorageError(responseError(resp, dirPrefix, "list"));

    const auto page = s3::parseListPage(resp.body);
    return !page.objects.empty() || !page.prefixes.empty();
}

// ##### Object Operations #####

std::unique_ptr<std::istream> S3Client::get(const std::string& rel) const {
    const auto key = keyFor(rel);
    const auto [canonicalPath, url] = constructPaths(key);
    const auto hdrs = makeSigHeaders("GET", canonicalPath, "UNSIGNED-PAYLOAD");

    HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        Registry::cloud()->debug("[S3Client] GET {} failed: CURL={} HTTP={}", key, static_cast<int>(resp.curl), resp.http);
        throw StorageError(responseError(resp, rel, "download"));
    }

    return std::make_unique<std::istringstream>(std::move(resp.body));
}

void S3Client::put(const std::string& rel, const uint64_t sizeHint, std::istream& in) const {
    if (sizeHint >= multipartThreshold_) putMultipart(rel, in);
    else putSingle(rel, sizeHint, in);
}

void S3Client::putSingle(const std::string& rel, const uint64_t size, std::istream& in) const {
    const auto key = keyFor(rel);
    const auto [canonical, url] = constructPaths(key);

    SList hdrs = makeSigHeaders("PUT", canonical, "UNSIGNED-PAYLOAD");
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_READDATA, &in);
        curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        curl_easy_setopt(h, CURLOPT_READFUNCTION,
            +[](char* buf, const size_t sz, const size_t nm, void* ud) -> size_t {
                auto* is = static_cast<std::istream*>(ud);
                is->read(buf, static_cast<std::streamsize>(sz * nm));
                if (is->bad()) return CURL_READFUNC_ABORT;
                return static_cast<size_t>(is->gcount());
            });
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Client] PUT {} failed: CURL={} HTTP={} Response:\n{}",
                                 key, static_cast<int>(resp.curl), resp.http, resp.body);
        throw StorageError(responseError(resp, rel, "upload"));
    }
}

void S3Client::remove(const std::string& rel) const {
    const auto key = keyFor(rel);
    const auto [canonical, url] = constructPaths(key);

    const std::string payloadHash = sha256Hex("");
    const SList hdrs = makeSigHeaders("DELETE", canonical, payloadHash);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Client] DELETE {} failed: CURL={} HTTP={} Response:\n{}",
                                 key, static_cast<int>(resp.curl), resp.http, resp.body);
        throw StorageError(responseError(resp, rel, "remove"));
    }
}

std::unique_ptr<Subscription> S3Client::subscribe(bool) const {
    throw StorageError(ErrorKind::NotImplemented, location_.resolved,
                       "change notifications are not supported for object storage");
}
