#include "util/s3Helpers.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <curl/curl.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace ms::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    std::ostringstream oss;
    for (const unsigned char c : hash) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    return oss.str();
}

std::string hmacSha256Raw(const std::string& key, const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest, nullptr);
    return {reinterpret_cast<char*>(digest), SHA256_DIGEST_LENGTH};
}

std::string hmacSha256HexFromRaw(const std::string& rawKey, const std::string& data) {
    const auto raw = hmacSha256Raw(rawKey, data);
    std::ostringstream oss;
    for (const unsigned char i : raw) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(i);
    return oss.str();
}

std::string uriEncode(const std::string& s, const bool preserveSlashes) {
    std::ostringstream out;
    for (const unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (preserveSlashes && c == '/'))
            out << c;
        else
            out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::nouppercase << std::dec;
    }
    return out.str();
}

std::string escapeKeyPreserveSlashes(const std::string& key) {
    return uriEncode(key, true);
}

std::string canonicalQueryString(const std::map<std::string, std::string>& params) {
    std::vector<std::pair<std::string, std::string>> encoded;
    encoded.reserve(params.size());
    for (const auto& [k, v] : params) encoded.emplace_back(uriEncode(k, false), uriEncode(v, false));
    std::ranges::sort(encoded);

    std::string out;
    for (const auto& [k, v] : encoded) {
        if (!out.empty()) out += '&';
        out += k + "=" + v;
    }
    return out;
}

std::string composeMultiPartUploadXMLBody(const std::vector<std::string>& etags) {
    std::ostringstream xml;

    xml << "<CompleteMultipartUpload>";

    for (size_t i = 0; i < etags.size(); ++i)
        xml << "<Part><PartNumber>" << (i + 1) << "</PartNumber><ETag>" << etags[i] << "</ETag></Part>";

    xml << "</CompleteMultipartUpload>";

    return xml.str();
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

bool extractETag(const std::string& respHdr, std::string& etagOut) {
    const auto headers = parseHeaders(respHdr);
    const auto it = headers.find("etag");
    if (it == headers.end()) return false;
    etagOut = it->second;
    return !etagOut.empty();
}

std::map<std::string, std::string> parseHeaders(const std::string& rawHeaders) {
    std::map<std::string, std::string> out;
    std::istringstream headerStream(rawHeaders);
    std::string line;
    while (std::getline(headerStream, line)) {
        if (const auto pos = line.find(':'); pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trimInPlace(key);
            trimInPlace(value);
            std::ranges::transform(key, key.begin(), [](const unsigned char c) { return std::tolower(c); });
            out[std::move(key)] = std::move(value);
        }
    }
    return out;
}

std::string buildAuthorizationHeader(const config::AliasConfig& creds,
                                     const std::string& method,
                                     const std::string& canonicalPath,
                                     const std::map<std::string, std::string>& headers,
                                     const std::string& payloadHash,
                                     const std::string& canonicalQuery) {
    const std::string service = "s3";
    const std::string algorithm = "AWS4-HMAC-SHA256";
    const std::string amzDate = headers.at("x-amz-date");
    const std::string dateStamp = amzDate.substr(0, 8); // YYYYMMDD

    // headers is a std::map, so canonical order comes for free
    std::string canonicalHeaders, signedHeaders;
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        canonicalHeaders += it->first + ":" + it->second + "\n";
        signedHeaders += it->first;
        if (std::next(it) != headers.end())
            signedHeaders += ";";
    }

    std::ostringstream canonicalRequestStream;
    canonicalRequestStream << method << "\n"
                           << canonicalPath << "\n"
                           << canonicalQuery << "\n"
                           << canonicalHeaders << "\n"
                           << signedHeaders << "\n"
                           << payloadHash;
    const std::string hashedCanonicalRequest = sha256Hex(canonicalRequestStream.str());

    const std::string credentialScope = dateStamp + "/" + creds.region + "/" + service + "/aws4_request";
    std::ostringstream stringToSignStream;
    stringToSignStream << algorithm << "\n"
                       << amzDate << "\n"
                       << credentialScope << "\n"
                       << hashedCanonicalRequest;

    const std::string kDate    = hmacSha256Raw("AWS4" + creds.secret_key, dateStamp);
    const std::string kRegion  = hmacSha256Raw(kDate, creds.region);
    const std::string kService = hmacSha256Raw(kRegion, service);
    const std::string kSigning = hmacSha256Raw(kService, "aws4_request");

    const std::string signature = hmacSha256HexFromRaw(kSigning, stringToSignStream.str());

    std::ostringstream authHeader;
    authHeader << algorithm << " "
               << "Credential=" << creds.access_key << "/" << credentialScope << ", "
               << "SignedHeaders=" << signedHeaders << ", "
               << "Signature=" << signature;

    return authHeader.str();
}

void trimInPlace(std::string& s) {
    s.erase(s.begin(), std::ranges::find_if(s, [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

}
