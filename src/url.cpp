#include "url.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

Endpoint parse_endpoint(const std::string& url) {
    Endpoint ep;
    std::string rest;
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        throw std::invalid_argument("missing scheme in url: " + url);
    }
    ep.scheme = url.substr(0, sep);
    rest = url.substr(sep + 3);

    if (ep.scheme == "unix") {
        // unix://var/run/docker.sock and unix:///var/run/docker.sock both name an absolute path
        ep.path = rest.empty() || rest[0] != '/' ? "/" + rest : rest;
        if (ep.path == "/") throw std::invalid_argument("empty socket path in url: " + url);
        return ep;
    }
    if (ep.scheme != "http" && ep.scheme != "https" && ep.scheme != "tcp") {
        throw std::invalid_argument("unsupported scheme '" + ep.scheme + "' in url: " + url);
    }

    std::string hostport;
    if (rest.find('/') != std::string::npos) {
        hostport = rest.substr(0, rest.find('/'));
        ep.path = rest.substr(rest.find('/'));
    } else {
        hostport = rest;
        ep.path = "";
    }
    while (!ep.path.empty() && ep.path.back() == '/') ep.path.pop_back();

    if (hostport.find(':') != std::string::npos) {
        ep.host = hostport.substr(0, hostport.find(':'));
        ep.port = hostport.substr(hostport.find(':') + 1);
    } else {
        ep.host = hostport;
        ep.port = ep.scheme == "https" ? "443" : (ep.scheme == "tcp" ? "2375" : "80");
    }
    if (ep.host.empty()) {
        throw std::invalid_argument("empty host in url: " + url);
    }
    return ep;
}

std::string join_route(const std::string& base_path, const std::string& route) {
    std::string base = base_path;
    while (!base.empty() && base.back() == '/') base.pop_back();
    std::string r = route;
    size_t skip = 0;
    while (skip < r.size() && r[skip] == '/') ++skip;
    return base + "/" + r.substr(skip);
}

std::string url_encode(const std::string& s) {
    std::ostringstream out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << (int)c;
        }
    }
    return out.str();
}
