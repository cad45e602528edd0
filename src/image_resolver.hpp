#pragma once
#include <optional>
#include <string>

#include "job.hpp"
#include "transport.hpp"
#include "runtime/icontainer_runtime.hpp"

// Finds the local image for a job's application, asking the coordinator for a
// build context when no local image carries the exact name:tag.
class ImageResolver {
public:
    ImageResolver(IContainerRuntime& runtime, ITransport& transport);

    // nullopt when the image is neither present nor buildable. Never throws.
    std::optional<std::string> resolve(const Job& job);

private:
    std::optional<std::string> find_local(const std::string& name, const std::string& reference);
    bool build_from_coordinator(const std::string& reference);

    IContainerRuntime& runtime_;
    ITransport& transport_;
};
