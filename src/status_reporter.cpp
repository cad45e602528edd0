#include "status_reporter.hpp"
#include "engine_error.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

StatusReporter::StatusReporter(ITransport& transport) : transport_(transport) {}

void StatusReporter::report(const std::string& job_id, JobStatus status, const std::string& activity) {
    LOG_DEBUG("[report] updating job status");
    nlohmann::json payload = {
        {"status", to_string(status)},
        {"activity", activity},
    };
    auto res = transport_.send(ITransport::verb::put, "jobs/" + job_id, payload.dump());
    if (!res.ok()) {
        throw EngineError(res.status, res.reason);
    }
}
