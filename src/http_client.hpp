#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>

#include "transport.hpp"
#include "url.hpp"

// Coordinator transport over Boost.Beast. One connection per request, TLS when
// the API url is https. Every request carries the engine User-Agent.
class HttpClient : public ITransport {
public:
    HttpClient(const std::string& api_url, const std::string& user_agent,
               const std::string& ssl_cert, bool verify,
               std::chrono::seconds connect_timeout = std::chrono::seconds(30));
    ~HttpClient() override;

    HttpResponse send(verb method, const std::string& route, const std::string& body,
                      const std::string& content_type = "application/json") override;
    HttpResponse send_file(verb method, const std::string& route,
                           const std::filesystem::path& body_file,
                           const std::string& content_type) override;

    const Endpoint& endpoint() const { return endpoint_; }
    const std::string& user_agent() const { return user_agent_; }

private:
    template <class Request>
    HttpResponse perform(Request& req);

    Endpoint endpoint_;
    std::string user_agent_;
    bool verify_;
    std::chrono::seconds connect_timeout_;
    boost::asio::io_context ioc_;
    boost::asio::ssl::context ssl_ctx_;
};
