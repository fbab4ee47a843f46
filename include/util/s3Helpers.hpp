#pragma once

#include <istream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace ms::config { struct AliasConfig; }

namespace ms::util {

std::string sha256Hex(const std::string& data);
std::string hmacSha256Raw(const std::string& key, const std::string& data);
std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data);

// RFC 3986 encoding as SigV4 expects it; '/' survives when preserveSlashes is set.
std::string uriEncode(const std::string& s, bool preserveSlashes);
std::string escapeKeyPreserveSlashes(const std::string& key);

// Sorted, encoded "k=v&k=v" form shared by the request URL and the signature.
std::string canonicalQueryString(const std::map<std::string, std::string>& params);

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags);
size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);
[[nodiscard]] bool extractETag(const std::string& respHdr, std::string& etagOut);
[[nodiscard]] std::map<std::string, std::string> parseHeaders(const std::string& rawHeaders);

std::string buildAuthorizationHeader(const config::AliasConfig& creds,
                                     const std::string& method, const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash, const std::string& canonicalQuery = "");
void trimInPlace(std::string& s);

void ensureCurlGlobalInit();

inline std::string slurp(const std::istream& in) {
    std::ostringstream oss;
    oss << in.rdbuf();          // copy entire buffer
    return oss.str();
}

}
