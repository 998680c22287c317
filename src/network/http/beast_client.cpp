#include "beast_client.hpp"
#include <boost/asio/redirect_error.hpp>
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Robocache {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using Core::Logger;

namespace {

Response error_response(const std::string& effective_url, const std::string& msg, ErrorType type) {
    Response response;
    response.effective_url = effective_url;
    response.success       = false;
    response.error         = msg;
    response.error_type    = type;
    response.status_code   = static_cast<long>(HTTPCode::NetworkError);
    return response;
}

// Host header value; the port is carried only when it is not the scheme default.
std::string host_header(const std::string& host, const std::string& port, const std::string& scheme) {
    if (port == std::to_string(Core::default_port(scheme)))
        return host;
    return host + ":" + port;
}

// Reads the header, then the body until it completes or passes `max_body`
// bytes. An oversized body is cut to `max_body` instead of failing the read.
template <typename Stream>
net::awaitable<http::response<http::string_body>> read_response(Stream&             stream,
                                                                beast::flat_buffer& buffer,
                                                                size_t              max_body) {
    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);

    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
    while (!parser.is_done() && parser.get().body().size() <= max_body)
        co_await http::async_read_some(stream, buffer, parser, net::use_awaitable);

    http::response<http::string_body> res = parser.release();
    if (res.body().size() > max_body)
        res.body().resize(max_body);
    co_return res;
}

}  // namespace

BeastClient::BeastClient(std::string user_agent) : user_agent_(std::move(user_agent)) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout_ = timeout;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    auto        parsed = Utils::Url::parse(url);
    std::string scheme = Utils::Text::to_lower(parsed.scheme);
    if (parsed.host.empty() || (scheme != "http" && scheme != "https")) {
        co_return error_response(url, "Invalid URL", ErrorType::Protocol);
    }

    std::string host   = parsed.host;
    std::string port   = std::to_string(parsed.effective_port());
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;

    bool        is_ssl        = (scheme == "https");
    std::string effective_url = scheme + "://" + host + ":" + port + target;

    try {
        if (!is_ssl)
            co_return co_await perform_http_request(host, port, target, effective_url);
        co_return co_await perform_https_request(host, port, target, effective_url);
    } catch (const boost::system::system_error& e) {
        ErrorType type = (e.code() == beast::error::timeout) ? ErrorType::Timeout : ErrorType::Network;
        Logger::debug("GET " + effective_url + " failed: " + e.what());
        co_return error_response(effective_url, e.what(), type);
    } catch (const std::exception& e) {
        Logger::debug("GET " + effective_url + " failed: " + e.what());
        co_return error_response(effective_url, e.what(), ErrorType::Other);
    }
}

http::request<http::empty_body> BeastClient::make_request(const std::string& host_field,
                                                          const std::string& target) const {
    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host_field);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/plain, */*;q=0.8");
    return req;
}

Response BeastClient::to_response(http::response<http::string_body>& res,
                                  const std::string&                 effective_url) {
    Response response;
    response.effective_url = effective_url;
    response.status_code   = res.result_int();
    response.body          = std::move(res.body());
    response.success       = (response.status_code >= 200 && response.status_code < 400);
    for (const auto& field : res) {
        // First occurrence wins for repeated headers.
        response.headers.emplace(Utils::Text::to_lower(std::string(field.name_string())),
                                 std::string(field.value()));
    }
    response.content_type = response.header("content-type");
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

net::awaitable<Response> BeastClient::perform_http_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target,
                                                           const std::string& effective_url) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);
    auto req = make_request(host_header(host, port, "http"), target);
    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer b;
    auto               res = co_await read_response(stream, b, max_body_bytes_);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return to_response(res, effective_url);
}

net::awaitable<Response> BeastClient::perform_https_request(const std::string& host,
                                                            const std::string& port,
                                                            const std::string& target,
                                                            const std::string& effective_url) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto results = co_await resolver.async_resolve(host, port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);
    auto req = make_request(host_header(host, port, "https"), target);
    co_await http::async_write(ssl_stream, req, net::use_awaitable);

    beast::flat_buffer b;
    auto               res = co_await read_response(ssl_stream, b, max_body_bytes_);

    // Many servers drop the connection without close_notify; that is not a failed fetch.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return to_response(res, effective_url);
}

}  // namespace Http
}  // namespace Network
}  // namespace Robocache
