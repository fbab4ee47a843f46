#pragma once

#include "storage/Client.hpp"
#include "config/Config.hpp"
#include "util/curlWrappers.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ms::storage {

namespace s3 {

// One ListObjectsV2 response page.
struct ListPage {
    std::vector<model::Entry> objects;   // path holds the full key
    std::vector<std::string> prefixes;   // CommonPrefixes, trailing '/' kept
    bool truncated = false;
    std::string nextToken;
};

ListPage parseListPage(const std::string& xml);

}

class S3Client final : public Client {
public:
    static constexpr uintmax_t MIN_PART_SIZE = config::MIN_PART_SIZE_BYTES;

    S3Client(Location location, config::AliasConfig alias, const config::MirrorConfig& mirror);

    [[nodiscard]] std::unique_ptr<Lister> list(const std::string& rel, bool recursive, bool includeDirs) const override;
    [[nodiscard]] model::Entry stat(const std::string& rel) const override;

    [[nodiscard]] std::unique_ptr<std::istream> get(const std::string& rel) const override;
    void put(const std::string& rel, uint64_t sizeHint, std::istream& in) const override;
    void remove(const std::string& rel) const override;

    [[nodiscard]] std::unique_ptr<Subscription> subscribe(bool recursive) const override;

    [[nodiscard]] const std::string& bucket() const { return bucket_; }
    [[nodiscard]] const std::string& prefix() const { return prefix_; }

    // One delimiter listing level, all pages. dirPrefix is "" or ends with '/'.
    [[nodiscard]] std::pair<std::vector<model::Entry>, std::vector<std::string>>
    listLevel(const std::string& dirPrefix) const;

    // ##### Multipart #####

    [[nodiscard]] std::string initiateMultipartUpload(const std::string& key) const;

    [[nodiscard]] std::string uploadPart(const std::string& key, const std::string& uploadId,
                                         int partNumber, const std::string& partData) const;

    void completeMultipartUpload(const std::string& key, const std::string& uploadId,
                                 const std::vector<std::string>& etags) const;

    void abortMultipartUpload(const std::string& key, const std::string& uploadId) const;

private:
    config::AliasConfig alias_;
    std::string bucket_;
    std::string prefix_;
    uintmax_t multipartThreshold_;
    uintmax_t partSize_;

    [[nodiscard]] std::string keyFor(const std::string& rel) const;

    [[nodiscard]] std::map<std::string, std::string> buildHeaderMap(const std::string& payloadHash) const;

    // {canonical path, full url}
    [[nodiscard]] std::pair<std::string, std::string> constructPaths(const std::string& key,
                                                                     const std::string& query = "") const;

    [[nodiscard]] util::SList makeSigHeaders(const std::string& method,
                                             const std::string& canonical,
                                             const std::string& payloadHash,
                                             const std::string& query = "") const;

    [[nodiscard]] bool prefixExists(const std::string& dirPrefix) const;

    void putSingle(const std::string& rel, uint64_t size, std::istream& in) const;
    void putMultipart(const std::string& rel, std::istream& in) const;
};

// Maps a failed response onto the storage error taxonomy.
Error responseError(const util::HttpResponse& resp, const std::string& path, std::string_view op);

}
