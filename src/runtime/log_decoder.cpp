#include "log_decoder.hpp"
#include <algorithm>

static constexpr std::size_t kHeaderSize = 8;

void LogLineDecoder::feed(const char* data, std::size_t n, const LineSink& sink) {
    std::size_t pos = 0;
    while (pos < n) {
        if (remaining_ == 0) {
            std::size_t take = std::min(kHeaderSize - header_.size(), n - pos);
            header_.append(data + pos, take);
            pos += take;
            if (header_.size() < kHeaderSize) return;

            stream_ = static_cast<uint8_t>(header_[0]);
            remaining_ = (std::size_t(static_cast<uint8_t>(header_[4])) << 24) |
                         (std::size_t(static_cast<uint8_t>(header_[5])) << 16) |
                         (std::size_t(static_cast<uint8_t>(header_[6])) << 8) |
                          std::size_t(static_cast<uint8_t>(header_[7]));
            header_.clear();
            continue;
        }
        std::size_t take = std::min(remaining_, n - pos);
        if (stream_ == kStdout) emit_payload(data + pos, take, sink);
        pos += take;
        remaining_ -= take;
    }
}

void LogLineDecoder::emit_payload(const char* data, std::size_t n, const LineSink& sink) {
    for (std::size_t i = 0; i < n; ++i) {
        if (data[i] == '\n') {
            if (!line_.empty() && line_.back() == '\r') line_.pop_back();
            sink(line_);
            line_.clear();
        } else {
            line_.push_back(data[i]);
        }
    }
}

void LogLineDecoder::flush(const LineSink& sink) {
    if (!line_.empty()) {
        sink(line_);
        line_.clear();
    }
}
