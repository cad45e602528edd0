#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include "config.hpp"
#include "container_runner.hpp"
#include "image_resolver.hpp"
#include "input_stager.hpp"
#include "job.hpp"
#include "job_poller.hpp"
#include "result_submitter.hpp"
#include "staging_area.hpp"
#include "status_reporter.hpp"
#include "transport.hpp"
#include "runtime/icontainer_runtime.hpp"

// State carried through one claimed job. Owned by a single iteration.
struct IterationContext {
    Job job;
    std::optional<std::string> image_id;
    std::string container_id;
    JobStatus status{JobStatus::Failed};
    std::string activity;
};

struct IterationOutcome {
    std::string job_id;
    JobStatus status{JobStatus::Failed};
    std::string activity;
};

// Composition root: claim -> resolve -> stage -> execute -> collect/submit ->
// teardown -> report, one job at a time.
class Engine {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    Engine(const EngineConfig& config, ITransport& transport, IContainerRuntime& runtime,
           Sleeper sleep = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); });

    // Processes jobs until halt_flag is set. The flag is sampled once per
    // iteration, before claiming; an iteration that has started (container
    // run, upload, report) always runs to its end first.
    void run(const std::atomic<bool>& halt_flag);

    // One iteration. nullopt when no job was claimed; the idle delay has
    // already been slept in that case. Throws only when the final status
    // report fails.
    std::optional<IterationOutcome> run_once();

private:
    void process_in_staging_area(IterationContext& ctx);
    void execute_and_collect(IterationContext& ctx, const StagingArea& area);
    void teardown(IterationContext& ctx);
    static void fail(IterationContext& ctx, const std::string& activity);

    EngineConfig config_;
    Sleeper sleep_;

    JobPoller poller_;
    ImageResolver resolver_;
    InputStager stager_;
    ContainerRunner runner_;
    ResultSubmitter submitter_;
    StatusReporter reporter_;
};
