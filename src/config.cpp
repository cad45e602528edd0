#include "config.hpp"
#include <stdexcept>
#include <vector>

std::filesystem::path EngineConfig::staging_parent() const {
    return tempdir.empty() ? std::filesystem::temp_directory_path() : tempdir;
}

std::string usage(const std::string& argv0) {
    return "Usage: " + argv0 + " api engine_id ssl_cert [options]\n"
           "\n"
           "  api                  target api, example: https://www.example.com/api\n"
           "  engine_id            engine identification\n"
           "  ssl_cert             path to SSL certificate (PEM with key)\n"
           "\n"
           "  --no_verify          do not attempt SSL verification of API\n"
           "  --docker_api URL     tcp or unix socket to docker api (default unix://var/run/docker.sock)\n"
           "  --local_mode         local access to data (NFS/mount)\n"
           "  --data_path PATH     local path to data, required if local_mode enabled\n"
           "  --log_level LEVEL    error, warning, info, debug or trace (default info)\n"
           "  --no_remove          do not remove containers after job stops\n"
           "  --group NAME         only claim jobs of this group\n"
           "  --project NAME       only claim jobs of this project\n"
           "  --engine_name NAME   User-Agent product name (default \"SciTran Engine\")\n"
           "  --idle_seconds N     wait between polls when there is no work (default 10)\n"
           "  --scratch PATH       host directory mounted read-only at /scratch (default /scratch)\n"
           "  --tempdir PATH       parent directory for job staging areas\n"
           "\nThe engine can be stopped gracefully with Ctrl+C (SIGINT) or SIGTERM.\n";
}

EngineConfig parse_args(int argc, const char* const* argv) {
    EngineConfig c;
    std::vector<std::string> positional;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        if (s == "--help" || s == "-h") { c.show_help = true; return c; }
        else if (s == "--no_verify") { c.verify = false; }
        else if (s == "--docker_api") { c.docker_api = value(i, s); }
        else if (s == "--local_mode") { c.local_mode = true; }
        else if (s == "--data_path") { c.data_path = value(i, s); }
        else if (s == "--log_level") {
            auto v = value(i, s);
            if (!Logger::parseLevel(v, c.log_level)) throw std::invalid_argument("unknown log level: " + v);
        }
        else if (s == "--no_remove") { c.no_remove = true; }
        else if (s == "--group") { c.group = value(i, s); }
        else if (s == "--project") { c.project = value(i, s); }
        else if (s == "--engine_name") { c.engine_name = value(i, s); }
        else if (s == "--idle_seconds") {
            auto v = value(i, s);
            int n = 0;
            try { n = std::stoi(v); } catch (const std::exception&) { n = -1; }
            if (n < 0) throw std::invalid_argument("--idle_seconds must be a non-negative integer: " + v);
            c.idle_delay = std::chrono::seconds(n);
        }
        else if (s == "--scratch") { c.scratch_path = value(i, s); }
        else if (s == "--tempdir") { c.tempdir = value(i, s); }
        else if (s.rfind("--", 0) == 0) { throw std::invalid_argument("unknown arg: " + s); }
        else { positional.push_back(s); }
    }

    if (positional.size() != 3) {
        throw std::invalid_argument("expected api, engine_id and ssl_cert, got " +
                                    std::to_string(positional.size()) + " positional arguments");
    }
    c.api_url = positional[0];
    c.engine_id = positional[1];
    c.ssl_cert = positional[2];

    // bad arg combinations
    if (c.local_mode && c.data_path.empty()) {
        throw std::invalid_argument("local mode (--local_mode) requires data path (--data_path)");
    }
    if (!c.local_mode && !c.data_path.empty()) {
        LOG_WARN("data path (--data_path) set without local mode, ignoring data_path");
        c.data_path.clear();
    }
    return c;
}
