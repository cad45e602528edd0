#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "staging_area.hpp"
#include "runtime/icontainer_runtime.hpp"

// Host side of the four fixed mounts. /scratch is always read-only,
// /input, /output and /meta are always read-write.
struct ExecutionBindings {
    std::filesystem::path scratch;
    std::filesystem::path input;
    std::filesystem::path output;
    std::filesystem::path meta;

    static ExecutionBindings for_area(const StagingArea& area, const std::filesystem::path& scratch);
    std::vector<Bind> binds() const;
};

class ContainerRunner {
public:
    explicit ContainerRunner(IContainerRuntime& runtime, int max_log_reconnects = 3);

    static const std::vector<std::string>& mount_points();

    // Runs the image to completion and returns its exit code. A non-zero code
    // is a normal outcome. container_id is set as soon as the container
    // exists so the caller can remove it whatever happens afterwards.
    int execute(const std::string& image, const std::vector<std::string>& cmd,
                const ExecutionBindings& bindings, std::string& container_id);

    void remove(const std::string& container_id);

private:
    void follow_logs(const std::string& container_id);

    IContainerRuntime& runtime_;
    int max_log_reconnects_;
};
