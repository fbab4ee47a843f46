#include "util/pathOrder.hpp"

#include <algorithm>

namespace ms::util {

int comparePaths(const std::string_view a, const std::string_view b) {
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        if (a[i] == b[i]) continue;
        if (a[i] == '/') return -1;
        if (b[i] == '/') return 1;
        return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[i]) ? -1 : 1;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

bool isWithin(const std::string_view path, const std::string_view prefix) {
    if (prefix.empty()) return true;
    if (!path.starts_with(prefix)) return false;
    return path.size() == prefix.size() || path[prefix.size()] == '/';
}

std::string joinPath(const std::string_view base, const std::string_view rel) {
    if (base.empty()) return std::string(rel);
    if (rel.empty()) return std::string(base);
    std::string out(base);
    if (out.back() != '/') out += '/';
    out.append(rel.front() == '/' ? rel.substr(1) : rel);
    return out;
}

std::string normalizeRel(const std::string_view rel) {
    std::string out;
    out.reserve(rel.size());
    for (const char c : rel) {
        if (c == '/' && (out.empty() || out.back() == '/')) continue;
        out.push_back(c);
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

}
