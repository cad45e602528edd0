#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

struct ImageSummary {
    std::string id;
    std::vector<std::string> repo_tags;
};

struct Bind {
    std::string host_path;
    std::string container_path;
    bool read_only{false};
};

struct ContainerSpec {
    std::string image;
    std::vector<std::string> volumes;   // container-internal mount points
    std::vector<std::string> cmd;
    std::vector<Bind> binds;
};

enum class LogStreamEnd { Finished, Interrupted };

using LineSink = std::function<void(const std::string&)>;

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    virtual std::vector<ImageSummary> list_images(const std::string& name) = 0;
    // Builds and tags an image from a tar build context. False when the build failed.
    virtual bool build_image(const std::string& reference, const std::string& context_tar) = 0;

    virtual std::string create_container(const ContainerSpec& spec) = 0;
    virtual void start_container(const std::string& id) = 0;
    // Follows stdout of the container until it exits. since is a unix
    // timestamp, 0 for the whole log.
    virtual LogStreamEnd stream_logs(const std::string& id, int64_t since, const LineSink& sink) = 0;
    virtual int wait_container(const std::string& id) = 0;
    virtual void remove_container(const std::string& id, bool remove_volumes) = 0;
};
