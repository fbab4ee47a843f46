#include "progress/BarSink.hpp"
#include "progress/QuietSink.hpp"
#include "util/cmdLineHelpers.hpp"

#include <algorithm>
#include <fmt/color.h>

using namespace ms::progress;
using namespace ms::sync::model;
using namespace ms::util;

BarSink::BarSink(const bool color, std::FILE* out)
    : color_(color), tty_(isatty(fileno(out)) == 1), out_(out) {}

std::string BarSink::renderLine(const Summary& s) const {
    const auto width = static_cast<size_t>(term_width(fileno(out_)));
    const double ratio = s.totalBytes > 0
        ? std::min(1.0, static_cast<double>(s.bytes) / static_cast<double>(s.totalBytes))
        : (s.totalObjects > 0 ? static_cast<double>(s.objects) / static_cast<double>(s.totalObjects) : 0.0);

    const auto stats = fmt::format(" {:3d}% {} / {}  {}/s", static_cast<int>(ratio * 100.0),
                                   human_bytes(s.bytes), human_bytes(s.totalBytes),
                                   human_bytes(static_cast<uint64_t>(s.bytesPerSecond())));

    constexpr size_t barWidth = 20;
    const auto filled = static_cast<size_t>(ratio * barWidth);
    const auto bar = "[" + std::string(filled, '#') + std::string(barWidth - filled, ' ') + "]";

    const size_t fixed = bar.size() + stats.size() + 2;
    const auto caption = width > fixed + 8 ? ellipsize_middle(caption_, width - fixed - 1) : std::string{};

    return fmt::format("{}  {}{}", caption, bar, stats);
}

void BarSink::clearLine() {
    if (!drawn_) return;
    if (tty_) fmt::print(out_, "\r\033[K");
    else fmt::print(out_, "\n");
    drawn_ = false;
}

void BarSink::draw(const Summary& s, const bool forced) {
    const auto now = std::chrono::steady_clock::now();
    if (!forced && drawn_ && now - lastDraw_ < REDRAW_INTERVAL) return;
    // redrawing is only meaningful on a terminal
    if (!tty_) return;
    lastDraw_ = now;

    const auto line = renderLine(s);
    fmt::print(out_, "\r\033[K");
    if (color_) fmt::print(out_, fmt::fg(fmt::color::cyan), "{}", line);
    else fmt::print(out_, "{}", line);
    std::fflush(out_);
    drawn_ = true;
}

void BarSink::onProgress(const Summary& s) { draw(s, false); }

void BarSink::onSuccess(const WorkItem&, const Summary& s) { draw(s, false); }

void BarSink::onError(const WorkItem& item, const Summary& s) {
    clearLine();
    printFailure(out_, item, color_);
    draw(s, true);
}

void BarSink::onCaption(const std::string& caption) { caption_ = caption; }

void BarSink::onMessage(const std::string& text) {
    clearLine();
    fmt::print(out_, "{}\n", text);
    std::fflush(out_);
}

void BarSink::onFinish(const Summary& s) {
    draw(s, true);
    clearLine();
    const auto line = fmt::format("Total: {}, Transferred: {}, Speed: {}/s",
                                  human_bytes(s.totalBytes), human_bytes(s.bytes),
                                  human_bytes(static_cast<uint64_t>(s.bytesPerSecond())));
    if (color_) fmt::print(out_, fmt::emphasis::bold, "{}\n", line);
    else fmt::print(out_, "{}\n", line);
    std::fflush(out_);
}
