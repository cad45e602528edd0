#pragma once
#include <optional>
#include <string>

#include "job.hpp"
#include "transport.hpp"

// Claims the next job for the worker's (group, project) scope.
class JobPoller {
public:
    JobPoller(ITransport& transport, std::string group, std::string project);

    // nullopt when the coordinator has no work, answers with an error
    // status, or sends something that is not a job.
    std::optional<Job> claim();

private:
    ITransport& transport_;
    std::string group_;
    std::string project_;
};
