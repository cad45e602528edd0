#pragma once
#include <string>

struct Endpoint {
    std::string scheme; // http, https, unix, tcp
    std::string host;
    std::string port;
    std::string path;   // base path (http/https) or socket path (unix)

    bool secure() const { return scheme == "https"; }
};

// Splits "scheme://host[:port][/path]". Throws std::invalid_argument on an
// unsupported scheme or an empty host.
Endpoint parse_endpoint(const std::string& url);

// Joins a base path and a relative route with exactly one '/' between them.
std::string join_route(const std::string& base_path, const std::string& route);

std::string url_encode(const std::string& s);
