#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/beast/http/verb.hpp>
#include <string>

#include "icontainer_runtime.hpp"
#include "../transport.hpp"
#include "../url.hpp"

// Docker Engine API client. Talks HTTP/1.1 over the daemon's unix socket
// (unix:///var/run/docker.sock) or plain TCP (tcp://host:2375).
class DockerRuntime : public IContainerRuntime {
public:
    explicit DockerRuntime(const std::string& docker_api);
    ~DockerRuntime() override;

    std::vector<ImageSummary> list_images(const std::string& name) override;
    bool build_image(const std::string& reference, const std::string& context_tar) override;

    std::string create_container(const ContainerSpec& spec) override;
    void start_container(const std::string& id) override;
    LogStreamEnd stream_logs(const std::string& id, int64_t since, const LineSink& sink) override;
    int wait_container(const std::string& id) override;
    void remove_container(const std::string& id, bool remove_volumes) override;

private:
    HttpResponse request(boost::beast::http::verb method, const std::string& target,
                         const std::string& body = "",
                         const std::string& content_type = "application/json");

    template <class F>
    auto with_connection(F&& f);

    Endpoint endpoint_;
    boost::asio::io_context ioc_;
};
