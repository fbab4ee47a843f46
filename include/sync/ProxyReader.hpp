#pragma once

#include <cstdint>
#include <functional>
#include <istream>
#include <streambuf>
#include <vector>

namespace ms::sync {

// Stream buffer over another istream that reports bytes as they are read.
// Reports are batched to at most one per reportEvery bytes, plus one at EOF.
class ProxyReader : public std::streambuf {
public:
    using Callback = std::function<void(uint64_t)>;

    ProxyReader(std::istream& inner, Callback onRead, size_t bufferSize = 64 * 1024,
                uint64_t reportEvery = 1024 * 1024);

    [[nodiscard]] uint64_t total() const { return total_; }

protected:
    int_type underflow() override;

private:
    std::istream& inner_;
    Callback onRead_;
    std::vector<char> buffer_;
    uint64_t reportEvery_;
    uint64_t total_ = 0;
    uint64_t unreported_ = 0;

    void flushReport();
};

}
