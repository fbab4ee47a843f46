#include "progress/QuietSink.hpp"

#include <fmt/color.h>

using namespace ms::progress;
using namespace ms::sync::model;

namespace ms::progress {

std::string describeFailure(const WorkItem& item) {
    if (!item.error) return fmt::format("{}: unknown failure", item.id());
    const auto& err = *item.error;
    const auto path = err.path.empty() ? item.id() : err.path;
    return fmt::format("{}: {}", path, err.message);
}

void printFailure(std::FILE* out, const WorkItem& item, const bool color) {
    if (color) fmt::print(out, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "mirrorsync: <ERROR>");
    else fmt::print(out, "mirrorsync: <ERROR>");
    fmt::print(out, " {}\n", describeFailure(item));
    std::fflush(out);
}

}

void QuietSink::onError(const WorkItem& item, const Summary&) {
    printFailure(err_, item, color_);
}
