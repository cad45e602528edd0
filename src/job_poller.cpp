#include "job_poller.hpp"
#include "logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

JobPoller::JobPoller(ITransport& transport, std::string group, std::string project)
    : transport_(transport), group_(std::move(group)), project_(std::move(project)) {}

std::optional<Job> JobPoller::claim() {
    json payload = {
        {"group", group_.empty() ? json() : json(group_)},
        {"project", project_.empty() ? json() : json(project_)},
    };
    LOG_DEBUG("[poller] requesting job from jobs/next");
    auto res = transport_.send(ITransport::verb::get, "jobs/next", payload.dump());
    if (!res.ok()) {
        LOG_WARN("[poller] HTTP " + std::to_string(res.status) + ": " + res.reason);
        return std::nullopt;
    }

    auto job = parse_job(res.body);
    if (!job) {
        LOG_DEBUG("[poller] no job in response");
        return std::nullopt;
    }
    LOG_DEBUG("[poller] " + res.body);
    LOG_INFO("JOB " + job->id + " - " + job->app_id + " - " + job->group + "/" + job->project_name + ", claimed");
    return job;
}
