#pragma once

#include "progress/Sink.hpp"

#include <cstdio>

namespace ms::progress {

class QuietSink final : public Sink {
public:
    explicit QuietSink(bool color = false, std::FILE* err = stderr) : color_(color), err_(err) {}

protected:
    void onError(const sync::model::WorkItem& item, const Summary& s) override;

private:
    bool color_;
    std::FILE* err_;
};

// Shared by the human-readable sinks.
std::string describeFailure(const sync::model::WorkItem& item);
void printFailure(std::FILE* out, const sync::model::WorkItem& item, bool color);

}
