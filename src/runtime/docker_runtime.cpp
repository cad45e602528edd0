#include "docker_runtime.hpp"
#include "log_decoder.hpp"
#include "../engine_error.hpp"
#include "../logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using local_stream = boost::asio::local::stream_protocol;
using json = nlohmann::json;

// Docker error bodies look like {"message": "..."}
static std::string docker_message(const HttpResponse& res) {
    json j = json::parse(res.body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("message") && j["message"].is_string()) {
        return j["message"].get<std::string>();
    }
    return res.body;
}

static void expect(const HttpResponse& res, std::initializer_list<unsigned> accepted, const std::string& what) {
    if (std::find(accepted.begin(), accepted.end(), res.status) == accepted.end()) {
        throw EngineError(res.status, res.reason, what + ": " + docker_message(res));
    }
}

DockerRuntime::DockerRuntime(const std::string& docker_api)
    : endpoint_(parse_endpoint(docker_api)) {
    if (endpoint_.scheme != "unix" && endpoint_.scheme != "tcp") {
        throw std::invalid_argument("docker api must be unix:// or tcp://, got " + docker_api);
    }
    LOG_DEBUG("[docker] using " + endpoint_.scheme + " endpoint " +
              (endpoint_.scheme == "unix" ? endpoint_.path : endpoint_.host + ":" + endpoint_.port));
}

DockerRuntime::~DockerRuntime() = default;

template <class F>
auto DockerRuntime::with_connection(F&& f) {
    if (endpoint_.scheme == "unix") {
        local_stream::socket sock(ioc_);
        sock.connect(local_stream::endpoint(endpoint_.path));
        return f(sock);
    }
    tcp::resolver resolver(ioc_);
    tcp::socket sock(ioc_);
    net::connect(sock, resolver.resolve(endpoint_.host, endpoint_.port));
    return f(sock);
}

HttpResponse DockerRuntime::request(http::verb method, const std::string& target,
                                    const std::string& body, const std::string& content_type) {
    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "docker");
    req.keep_alive(false);
    if (!body.empty()) {
        req.set(http::field::content_type, content_type);
        req.body() = body;
    }
    req.prepare_payload();
    LOG_TRACE("[docker] " + std::string(http::to_string(method)) + " " + target);

    return with_connection([&](auto& sock) {
        http::write(sock, req);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read(sock, buffer, parser);

        auto& res = parser.get();
        HttpResponse out;
        out.status = res.result_int();
        out.reason = std::string(res.reason());
        out.body = std::move(res.body());
        return out;
    });
}

std::vector<ImageSummary> DockerRuntime::list_images(const std::string& name) {
    json filters = {{"reference", {name}}};
    auto res = request(http::verb::get, "/images/json?filters=" + url_encode(filters.dump()));
    expect(res, {200}, "list images " + name);

    std::vector<ImageSummary> images;
    json j = json::parse(res.body);
    for (const auto& img : j) {
        ImageSummary s;
        s.id = img.value("Id", std::string());
        if (img.contains("RepoTags") && img["RepoTags"].is_array()) {
            for (const auto& t : img["RepoTags"]) {
                if (t.is_string()) s.repo_tags.push_back(t.get<std::string>());
            }
        }
        images.push_back(std::move(s));
    }
    return images;
}

bool DockerRuntime::build_image(const std::string& reference, const std::string& context_tar) {
    auto res = request(http::verb::post, "/build?t=" + url_encode(reference), context_tar, "application/x-tar");
    if (!res.ok()) {
        LOG_ERROR("[docker] build of " + reference + " failed: HTTP " + std::to_string(res.status) +
                  " " + docker_message(res));
        return false;
    }
    // progress arrives as one JSON object per line; a failed step reports {"error": ...}
    std::istringstream lines(res.body);
    std::string line;
    while (std::getline(lines, line)) {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) continue;
        if (j.contains("error")) {
            LOG_ERROR("[docker] build of " + reference + " failed: " + j["error"].dump());
            return false;
        }
        if (j.contains("stream") && j["stream"].is_string()) {
            auto s = j["stream"].get<std::string>();
            while (!s.empty() && s.back() == '\n') s.pop_back();
            if (!s.empty()) LOG_DEBUG("[docker] build: " + s);
        }
    }
    return true;
}

std::string DockerRuntime::create_container(const ContainerSpec& spec) {
    json volumes = json::object();
    for (const auto& v : spec.volumes) volumes[v] = json::object();

    json binds = json::array();
    for (const auto& b : spec.binds) {
        binds.push_back(b.host_path + ":" + b.container_path + (b.read_only ? ":ro" : ":rw"));
    }

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.cmd},
        {"Volumes", volumes},
        {"HostConfig", {{"Binds", binds}}},
    };
    auto res = request(http::verb::post, "/containers/create", body.dump());
    expect(res, {201}, "create container from " + spec.image);

    json j = json::parse(res.body);
    auto id = j.at("Id").get<std::string>();
    if (j.contains("Warnings") && j["Warnings"].is_array()) {
        for (const auto& w : j["Warnings"]) LOG_WARN("[docker] " + w.dump());
    }
    return id;
}

void DockerRuntime::start_container(const std::string& id) {
    auto res = request(http::verb::post, "/containers/" + id + "/start");
    expect(res, {204, 304}, "start container " + id);
}

LogStreamEnd DockerRuntime::stream_logs(const std::string& id, int64_t since, const LineSink& sink) {
    std::string target = "/containers/" + id + "/logs?follow=1&stdout=1&stderr=0&timestamps=0";
    if (since > 0) target += "&since=" + std::to_string(since);

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "docker");
    req.keep_alive(false);

    return with_connection([&](auto& sock) {
        http::write(sock, req);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
        http::read_header(sock, buffer, parser);
        if (parser.get().result_int() != 200) {
            throw EngineError(parser.get().result_int(), std::string(parser.get().reason()), "logs of " + id);
        }

        LogLineDecoder decoder;
        char chunk[8192];
        while (!parser.is_done()) {
            parser.get().body().data = chunk;
            parser.get().body().size = sizeof(chunk);
            beast::error_code ec;
            http::read(sock, buffer, parser, ec);
            if (ec == http::error::need_buffer) ec = {};
            std::size_t n = sizeof(chunk) - parser.get().body().size;
            decoder.feed(chunk, n, sink);
            if (ec) {
                LOG_DEBUG("[docker] log stream of " + id + " interrupted: " + ec.message());
                decoder.flush(sink);
                return LogStreamEnd::Interrupted;
            }
        }
        decoder.flush(sink);
        return LogStreamEnd::Finished;
    });
}

int DockerRuntime::wait_container(const std::string& id) {
    auto res = request(http::verb::post, "/containers/" + id + "/wait");
    expect(res, {200}, "wait for container " + id);
    json j = json::parse(res.body);
    return j.at("StatusCode").get<int>();
}

void DockerRuntime::remove_container(const std::string& id, bool remove_volumes) {
    auto res = request(http::verb::delete_, "/containers/" + id + (remove_volumes ? "?v=1" : ""));
    expect(res, {204}, "remove container " + id);
}
