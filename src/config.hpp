#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "logger.hpp"

struct EngineConfig {
    std::string api_url;
    std::string engine_id;
    std::string ssl_cert;
    bool verify = true;
    std::string docker_api = "unix://var/run/docker.sock";
    bool local_mode = false;
    std::string data_path;
    LogLevel log_level = LogLevel::INFO;
    bool no_remove = false;                 // keep containers for debugging
    std::string group;
    std::string project;
    std::string engine_name = "SciTran Engine";
    std::chrono::seconds idle_delay{10};
    std::filesystem::path scratch_path = "/scratch";
    std::filesystem::path tempdir;          // empty: system temp directory
    bool show_help = false;

    std::string user_agent() const { return engine_name + " " + engine_id; }
    std::filesystem::path staging_parent() const;
};

// Throws std::invalid_argument with a printable message on bad input.
EngineConfig parse_args(int argc, const char* const* argv);

std::string usage(const std::string& argv0);
