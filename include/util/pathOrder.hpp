#pragma once

#include <string>
#include <string_view>

namespace ms::util {

// Component-wise ordering of relative paths: byte order with '/' sorting below
// every other byte. A depth-first walk with name-sorted children yields it.
[[nodiscard]] int comparePaths(std::string_view a, std::string_view b);

[[nodiscard]] inline bool pathLess(const std::string_view a, const std::string_view b) {
    return comparePaths(a, b) < 0;
}

// True when path is prefix itself or lies beneath it. The empty prefix is the root.
[[nodiscard]] bool isWithin(std::string_view path, std::string_view prefix);

[[nodiscard]] std::string joinPath(std::string_view base, std::string_view rel);

// Strips leading, trailing and duplicate slashes.
[[nodiscard]] std::string normalizeRel(std::string_view rel);

}
