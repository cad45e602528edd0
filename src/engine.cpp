#include "engine.hpp"
#include "logger.hpp"
#include <exception>

Engine::Engine(const EngineConfig& config, ITransport& transport, IContainerRuntime& runtime, Sleeper sleep)
    : config_(config),
      sleep_(std::move(sleep)),
      poller_(transport, config.group, config.project),
      resolver_(runtime, transport),
      stager_(transport),
      runner_(runtime),
      submitter_(transport),
      reporter_(transport) {}

void Engine::run(const std::atomic<bool>& halt_flag) {
    while (!halt_flag.load()) {
        try {
            run_once();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("[engine] iteration failed: ") + e.what());
            sleep_(config_.idle_delay);
        }
    }
    LOG_INFO("[engine] received halt - stopping");
}

std::optional<IterationOutcome> Engine::run_once() {
    auto job = poller_.claim();
    if (!job) {
        LOG_INFO("[engine] waiting for work");
        sleep_(config_.idle_delay);
        return std::nullopt;
    }

    IterationContext ctx{std::move(*job)};
    ctx.image_id = resolver_.resolve(ctx.job);
    if (!ctx.image_id) {
        // reported at once, without the idle delay, so the job leaves the queue
        LOG_ERROR("[engine] could not load or download app");
        fail(ctx, "could not load or download app " + ctx.job.app_id);
    } else {
        try {
            process_in_staging_area(ctx);
        } catch (const std::exception& e) {
            // staging area could not be created
            LOG_ERROR(std::string("[engine] ") + e.what());
            fail(ctx, e.what());
        }
    }

    reporter_.report(ctx.job.id, ctx.status, ctx.activity);
    LOG_INFO("JOB " + ctx.job.id + " - " + ctx.job.app_id + " - " + ctx.job.group + "/" +
             ctx.job.project_name + ", " + to_string(ctx.status) + " " + ctx.activity);
    return IterationOutcome{ctx.job.id, ctx.status, ctx.activity};
}

void Engine::process_in_staging_area(IterationContext& ctx) {
    StagingArea area(config_.staging_parent());
    try {
        execute_and_collect(ctx, area);
    } catch (const std::exception& e) {
        LOG_ERROR("[engine] job " + ctx.job.id + " failed: " + e.what());
        fail(ctx, e.what());
    }
    teardown(ctx);
}

void Engine::execute_and_collect(IterationContext& ctx, const StagingArea& area) {
    auto staged = stager_.stage(ctx.job, area);
    auto bindings = ExecutionBindings::for_area(area, config_.scratch_path);

    int exit_code = runner_.execute(*ctx.image_id, staged.args, bindings, ctx.container_id);
    if (exit_code != 0) {
        LOG_ERROR("[engine] container had non-zero exit code, " + std::to_string(exit_code));
        fail(ctx, "container had non-zero exit code " + std::to_string(exit_code));
        return;
    }

    auto outputs = collect_outputs(area.output());
    if (outputs.empty()) {
        fail(ctx, "no files were generated");
        return;
    }

    submitter_.submit(ctx.job, outputs, area.root());
    ctx.status = JobStatus::Done;
    ctx.activity = "generated";
    for (size_t i = 0; i < outputs.size(); ++i) {
        ctx.activity += (i ? ", " : " ") + outputs[i].filename().string();
    }
}

void Engine::teardown(IterationContext& ctx) {
    if (ctx.container_id.empty()) return;
    if (config_.no_remove) {
        LOG_INFO("[engine] leaving container " + ctx.container_id + " in place (--no_remove)");
        return;
    }
    try {
        runner_.remove(ctx.container_id);
    } catch (const std::exception& e) {
        LOG_ERROR("[engine] could not remove container " + ctx.container_id + ": " + e.what());
    }
}

void Engine::fail(IterationContext& ctx, const std::string& activity) {
    ctx.status = JobStatus::Failed;
    ctx.activity = activity;
}
