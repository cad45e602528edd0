#pragma once
#include <stdexcept>
#include <string>

// Raised when a remote operation (coordinator or container runtime) answers
// with a non-success status, or a job cannot proceed.
class EngineError : public std::runtime_error {
public:
    explicit EngineError(const std::string& message)
        : std::runtime_error(message) {}

    EngineError(unsigned status, const std::string& reason, const std::string& detail = "")
        : std::runtime_error(format(status, reason, detail)),
          status_(status),
          reason_(reason) {}

    unsigned status() const { return status_; }
    const std::string& reason() const { return reason_; }

private:
    static std::string format(unsigned status, const std::string& reason, const std::string& detail) {
        std::string s = std::to_string(status) + ", " + reason;
        if (!detail.empty()) s += "\n " + detail;
        return s;
    }

    unsigned status_{0};
    std::string reason_;
};
