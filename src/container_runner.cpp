#include "container_runner.hpp"
#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <exception>

static std::string now_string() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    char buf[32];
    std::tm tm{};
    localtime_r(&t, &tm);
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

static std::string join(const std::vector<std::string>& parts) {
    std::string s;
    for (const auto& p : parts) {
        if (!s.empty()) s += ' ';
        s += p;
    }
    return s;
}

ExecutionBindings ExecutionBindings::for_area(const StagingArea& area, const std::filesystem::path& scratch) {
    return ExecutionBindings{scratch, area.input(), area.output(), area.meta()};
}

std::vector<Bind> ExecutionBindings::binds() const {
    return {
        {scratch.string(), "/scratch", true},
        {input.string(), "/input", false},
        {output.string(), "/output", false},
        {meta.string(), "/meta", false},
    };
}

ContainerRunner::ContainerRunner(IContainerRuntime& runtime, int max_log_reconnects)
    : runtime_(runtime), max_log_reconnects_(max_log_reconnects) {}

const std::vector<std::string>& ContainerRunner::mount_points() {
    static const std::vector<std::string> vols = {"/input", "/output", "/meta", "/scratch"};
    return vols;
}

int ContainerRunner::execute(const std::string& image, const std::vector<std::string>& cmd,
                             const ExecutionBindings& bindings, std::string& container_id) {
    ContainerSpec spec;
    spec.image = image;
    spec.volumes = mount_points();
    spec.cmd = cmd;
    spec.binds = bindings.binds();

    LOG_DEBUG("[container] creating " + image + " container, command '" + join(cmd) + "'");
    container_id = runtime_.create_container(spec);

    if (Logger::enabled(LogLevel::DEBUG)) {
        std::string binds;
        for (const auto& b : spec.binds) {
            binds += " " + b.host_path + ":" + b.container_path + (b.read_only ? ":ro" : ":rw");
        }
        LOG_DEBUG("[container] starting container " + container_id + " with host volumes" + binds);
    }
    LOG_DEBUG("[container] job start at: " + now_string());
    runtime_.start_container(container_id);

    follow_logs(container_id);

    int exit_code = runtime_.wait_container(container_id);
    LOG_DEBUG("[container] job complete at: " + now_string() + ", exit code " + std::to_string(exit_code));
    return exit_code;
}

void ContainerRunner::follow_logs(const std::string& container_id) {
    // diagnostics only: a broken stream never fails the job
    const LineSink sink = [](const std::string& line) { LOG_DEBUG(line); };
    int64_t since = 0;
    for (int attempt = 0;; ++attempt) {
        LogStreamEnd end = LogStreamEnd::Interrupted;
        try {
            end = runtime_.stream_logs(container_id, since, sink);
        } catch (const std::exception& e) {
            LOG_DEBUG("[container] log stream error: " + std::string(e.what()));
        }
        if (end == LogStreamEnd::Finished || attempt >= max_log_reconnects_) {
            return;
        }
        since = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
        LOG_DEBUG("[container] reconnecting to log stream of " + container_id);
    }
}

void ContainerRunner::remove(const std::string& container_id) {
    LOG_DEBUG("[container] removing container: " + container_id);
    runtime_.remove_container(container_id, /*remove_volumes*/true);
}
