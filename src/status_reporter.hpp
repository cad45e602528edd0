#pragma once
#include <string>

#include "job.hpp"
#include "transport.hpp"

class StatusReporter {
public:
    explicit StatusReporter(ITransport& transport);

    // PUT jobs/<id> {status, activity}. Throws EngineError on a non-success answer.
    void report(const std::string& job_id, JobStatus status, const std::string& activity);

private:
    ITransport& transport_;
};
