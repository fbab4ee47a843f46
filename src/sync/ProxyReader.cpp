#include "sync/ProxyReader.hpp"

using namespace ms::sync;

ProxyReader::ProxyReader(std::istream& inner, Callback onRead, const size_t bufferSize, const uint64_t reportEvery)
    : inner_(inner), onRead_(std::move(onRead)), buffer_(bufferSize), reportEvery_(reportEvery) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

ProxyReader::int_type ProxyReader::underflow() {
    if (gptr() < egptr()) return traits_type::to_int_type(*gptr());

    inner_.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    const auto n = inner_.gcount();
    if (n <= 0) {
        flushReport();
        return traits_type::eof();
    }

    total_ += static_cast<uint64_t>(n);
    unreported_ += static_cast<uint64_t>(n);
    if (unreported_ >= reportEvery_) flushReport();

    setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
    return traits_type::to_int_type(*gptr());
}

void ProxyReader::flushReport() {
    if (unreported_ == 0 || !onRead_) return;
    onRead_(unreported_);
    unreported_ = 0;
}
