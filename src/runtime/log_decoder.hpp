#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "icontainer_runtime.hpp"

// Splits a multiplexed container log stream (8 byte frame headers: stream
// type, 3 padding bytes, big-endian payload length) into stdout lines.
// stderr frames are dropped. Bytes may arrive in arbitrary pieces.
class LogLineDecoder {
public:
    static constexpr uint8_t kStdout = 1;
    static constexpr uint8_t kStderr = 2;

    void feed(const char* data, std::size_t n, const LineSink& sink);
    // Emits a trailing partial line, if any.
    void flush(const LineSink& sink);

private:
    void emit_payload(const char* data, std::size_t n, const LineSink& sink);

    std::string header_;
    uint8_t stream_{0};
    std::size_t remaining_{0};
    std::string line_;
};
