#pragma once

#include "progress/Sink.hpp"

#include <iosfwd>

namespace ms::progress {

// One JSON object per line, for scripts.
class JsonSink final : public Sink {
public:
    explicit JsonSink(std::ostream& out);

protected:
    void onSuccess(const sync::model::WorkItem& item, const Summary& s) override;
    void onError(const sync::model::WorkItem& item, const Summary& s) override;
    void onMessage(const std::string& text) override;
    void onFinish(const Summary& s) override;

private:
    std::ostream& out_;
};

}
