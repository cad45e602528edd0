#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <exception>
#include "config.hpp"
#include "engine.hpp"
#include "http_client.hpp"
#include "logger.hpp"
#include "runtime/docker_runtime.hpp"

// Global flag for signal handling
static std::atomic<bool> g_halted{false};

// Signal handler. Only sets the flag; the engine notices it between jobs.
static void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_halted = true;
    }
}

int main(int argc, char** argv) {
    EngineConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }
    Logger::setLevel(config.log_level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        HttpClient coordinator{config.api_url, config.user_agent(), config.ssl_cert, config.verify};
        DockerRuntime docker{config.docker_api};

        Engine engine{config, coordinator, docker};
        LOG_INFO("[main] engine " + config.engine_id + " polling " + config.api_url);
        engine.run(g_halted); // blocking until SIGINT/SIGTERM
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("[main] ") + e.what());
        return 1;
    }

    LOG_WARN("Engine halted");
    return 0;
}
