#include "storage/s3/S3Client.hpp"
#include "util/s3Helpers.hpp"
#include "log/Registry.hpp"

#include <regex>

using namespace ms::storage;
using namespace ms::util;
using namespace ms::log;

std::string S3Client::initiateMultipartUpload(const std::string& key) const {
    const std::string query = "uploads=";
    const auto [canonicalPath, url] = constructPaths(key, "uploads");
    const auto hdrs = makeSigHeaders("POST", canonicalPath, "UNSIGNED-PAYLOAD", query);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(0));
    });

    if (!resp.ok()) {
        Registry::cloud()->error("[S3Client] initiateMultipartUpload failed: CURL={} HTTP={} Response:\n{}",
                                 static_cast<int>(resp.curl), resp.http, resp.body);
        throw StorageError(responseError(resp, key, "initiate multipart upload"));
    }

    std::smatch m;
    static const std::regex re(R"(<UploadId>([^<]+)</UploadId>)");
    if (std::regex_search(resp.body, m, re) && m.size() > 1)
        return m[1].str();

    throw StorageError(ErrorKind::IO, key, "initiate multipart upload returned no UploadId");
}

std::string S3Client::uploadPart(const std::string& key, const std::string& uploadId,
                                 const int partNumber, const std::string& partData) const {
    const auto query = canonicalQueryString({{"partNumber", std::to_string(partNumber)}, {"uploadId", uploadId}});
    const auto [canonicalPath, url] = constructPaths(key, query);

    SList hdrs = makeSigHeaders("PUT", canonicalPath, sha256Hex(partData), query);
    hdrs.add("Content-Type: application/octet-stream");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, partData.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(partData.size()));
    });

    if (!resp.ok()) throw StorageError(responseError(resp, key, fmt::format("upload part {}", partNumber)));

    std::string etag;
    if (!extractETag(resp.hdr, etag))
        throw StorageError(ErrorKind::IO, key, fmt::format("failed to extract ETag for uploaded part {}", partNumber));
    return etag;
}

void S3Client::completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                       const std::vector<std::string>& etags) const {
    if (etags.empty()) throw StorageError(ErrorKind::InvalidArgument, key, "no parts to complete");

    const auto query = canonicalQueryString({{"uploadId", uploadId}});
    const auto [canonicalPath, url] = constructPaths(key, query);

    const auto body = composeMultiPartUploadXMLBody(etags);
    SList hdrs = makeSigHeaders("POST", canonicalPath, sha256Hex(body), query);
    hdrs.add("Content-Type: application/xml");

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "POST");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    });

    // S3 can report a failed completion inside a 200 response
    if (!resp.ok() || resp.body.find("<Error>") != std::string::npos) {
        Registry::cloud()->error("[S3Client] completeMultipartUpload failed: CURL={} HTTP={} Response:\n{}",
                                 static_cast<int>(resp.curl), resp.http, resp.body);
        throw StorageError(resp.ok() ? Error{ErrorKind::Transport, key, "complete multipart upload failed"}
                                     : responseError(resp, key, "complete multipart upload"));
    }
}

void S3Client::abortMultipartUpload(const std::string& key, const std::string& uploadId) const {
    const auto query = canonicalQueryString({{"uploadId", uploadId}});
    const auto [canonicalPath, url] = constructPaths(key, query);
    const auto hdrs = makeSigHeaders("DELETE", canonicalPath, sha256Hex(""), query);

    const HttpResponse resp = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, hdrs.get());
    });

    if (!resp.ok()) throw StorageError(responseError(resp, key, "abort multipart upload"));
}

void S3Client::putMultipart(const std::string& rel, std::istream& in) const {
    const auto key = keyFor(rel);
    const auto uploadId = initiateMultipartUpload(key);

    std::vector<std::string> etags;
    try {
        std::string part(partSize_, '\0');
        for (int partNumber = 1;; ++partNumber) {
            in.read(part.data(), static_cast<std::streamsize>(part.size()));
            const auto n = static_cast<size_t>(in.gcount());
            if (in.bad()) throw StorageError(ErrorKind::IO, rel, "read from source failed");
            if (n == 0 && partNumber > 1) break;

            etags.push_back(uploadPart(key, uploadId, partNumber, part.substr(0, n)));
            if (n < part.size()) break;
        }
        completeMultipartUpload(key, uploadId, etags);
    } catch (const StorageError& e) {
        Registry::cloud()->warn("[S3Client] Aborting multipart upload of {}: {}", key, e.what());
        try {
            abortMultipartUpload(key, uploadId);
        } catch (const StorageError& abortErr) {
            Registry::cloud()->error("[S3Client] Abort of {} failed, upload {} left behind: {}",
                                     key, uploadId, abortErr.what());
        }
        throw;
    }

    Registry::cloud()->debug("[S3Client] Uploaded {} in {} parts", key, etags.size());
}
