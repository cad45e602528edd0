#include "http_client.hpp"
#include "engine_error.hpp"
#include "logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <class Stream, class Request>
static HttpResponse exchange(Stream& stream, Request& req) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    http::read(stream, buffer, parser);

    auto& res = parser.get();
    HttpResponse out;
    out.status = res.result_int();
    out.reason = std::string(res.reason());
    for (const auto& field : res) {
        out.headers[lower(std::string(field.name_string()))] = std::string(field.value());
    }
    out.body = std::move(res.body());
    return out;
}

HttpClient::HttpClient(const std::string& api_url, const std::string& user_agent,
                       const std::string& ssl_cert, bool verify,
                       std::chrono::seconds connect_timeout)
    : endpoint_(parse_endpoint(api_url)),
      user_agent_(user_agent),
      verify_(verify),
      connect_timeout_(connect_timeout),
      ssl_ctx_(ssl::context::tls_client) {
    if (endpoint_.scheme != "http" && endpoint_.scheme != "https") {
        throw std::invalid_argument("api url must be http or https: " + api_url);
    }
    ssl_ctx_.set_options(ssl::context::default_workarounds |
                         ssl::context::no_sslv2 |
                         ssl::context::no_sslv3 |
                         ssl::context::single_dh_use);
    if (verify_) {
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
        ssl_ctx_.set_default_verify_paths();
    } else {
        ssl_ctx_.set_verify_mode(ssl::verify_none);
    }
    if (!ssl_cert.empty()) {
        // single PEM holding the client certificate and its key
        ssl_ctx_.use_certificate_chain_file(ssl_cert);
        ssl_ctx_.use_private_key_file(ssl_cert, ssl::context::pem);
    }
    LOG_DEBUG("[http] api " + endpoint_.scheme + "://" + endpoint_.host + ":" + endpoint_.port + endpoint_.path +
              (verify_ ? "" : " (tls verification disabled)"));
}

HttpClient::~HttpClient() = default;

template <class Request>
HttpResponse HttpClient::perform(Request& req) {
    tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(endpoint_.host, endpoint_.port);

    if (!endpoint_.secure()) {
        beast::tcp_stream stream(ioc_);
        stream.expires_after(connect_timeout_);
        stream.connect(results);
        stream.expires_never();

        HttpResponse res = exchange(stream, req);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec && ec != beast::errc::not_connected) {
            LOG_TRACE("[http] shutdown: " + ec.message());
        }
        return res;
    }

    ssl::stream<beast::tcp_stream> stream(ioc_, ssl_ctx_);

    // SNI, and hostname check when verifying
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        throw beast::system_error{ec};
    }
    if (verify_) {
        stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));
    }

    beast::get_lowest_layer(stream).expires_after(connect_timeout_);
    beast::get_lowest_layer(stream).connect(results);
    stream.handshake(ssl::stream_base::client);
    beast::get_lowest_layer(stream).expires_never();

    HttpResponse res = exchange(stream, req);

    beast::error_code ec;
    stream.shutdown(ec);
    if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
        LOG_TRACE("[http] tls shutdown: " + ec.message());
    }
    return res;
}

HttpResponse HttpClient::send(verb method, const std::string& route, const std::string& body,
                              const std::string& content_type) {
    http::request<http::string_body> req{method, join_route(endpoint_.path, route), 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, user_agent_);
    req.keep_alive(false);
    if (!body.empty()) {
        req.set(http::field::content_type, content_type);
        req.body() = body;
    }
    req.prepare_payload();
    LOG_TRACE("[http] " + std::string(http::to_string(method)) + " " + std::string(req.target()));
    return perform(req);
}

HttpResponse HttpClient::send_file(verb method, const std::string& route,
                                   const std::filesystem::path& body_file,
                                   const std::string& content_type) {
    http::request<http::file_body> req{method, join_route(endpoint_.path, route), 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::content_type, content_type);
    req.keep_alive(false);

    beast::error_code ec;
    req.body().open(body_file.string().c_str(), beast::file_mode::scan, ec);
    if (ec) {
        throw EngineError("cannot open request body " + body_file.string() + ": " + ec.message());
    }
    req.prepare_payload();
    LOG_TRACE("[http] " + std::string(http::to_string(method)) + " " + std::string(req.target()) +
              " (" + std::to_string(req.body().size()) + " bytes from file)");
    return perform(req);
}
