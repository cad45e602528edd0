#pragma once
#include <boost/beast/http/verb.hpp>
#include <filesystem>
#include <map>
#include <string>

struct HttpResponse {
    unsigned status{0};
    std::string reason;
    std::string body;
    std::map<std::string, std::string> headers; // lower-cased names

    bool ok() const { return status >= 200 && status < 300; }

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

// Authenticated request/response channel to the coordinator. Routes are
// relative to the configured API base URL.
class ITransport {
public:
    using verb = boost::beast::http::verb;
    virtual ~ITransport() = default;

    virtual HttpResponse send(verb method, const std::string& route, const std::string& body,
                              const std::string& content_type = "application/json") = 0;

    // Streams the request body from a file instead of memory.
    virtual HttpResponse send_file(verb method, const std::string& route,
                                   const std::filesystem::path& body_file,
                                   const std::string& content_type) = 0;
};
