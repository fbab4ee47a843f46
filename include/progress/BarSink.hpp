#pragma once

#include "progress/Sink.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace ms::progress {

// Single redrawn status line on stderr.
class BarSink final : public Sink {
public:
    explicit BarSink(bool color, std::FILE* out = stderr);

protected:
    void onProgress(const Summary& s) override;
    void onSuccess(const sync::model::WorkItem& item, const Summary& s) override;
    void onError(const sync::model::WorkItem& item, const Summary& s) override;
    void onCaption(const std::string& caption) override;
    void onMessage(const std::string& text) override;
    void onFinish(const Summary& s) override;

private:
    static constexpr std::chrono::milliseconds REDRAW_INTERVAL{100};

    bool color_;
    bool tty_;
    std::FILE* out_;
    std::string caption_;
    std::chrono::steady_clock::time_point lastDraw_{};
    bool drawn_ = false;

    void draw(const Summary& s, bool forced);
    void clearLine();
    [[nodiscard]] std::string renderLine(const Summary& s) const;
};

}
