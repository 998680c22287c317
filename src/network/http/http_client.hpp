#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <map>
#include <string>

namespace Robocache {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Timeout, Protocol, Other };

enum class HTTPCode {
    NetworkError      = 0,
    Ok                = 200,
    MovedPermanently  = 301,
    Found             = 302,
    TemporaryRedirect = 307,
    PermanentRedirect = 308,
    Forbidden         = 403,
    ServerError       = 500
};

struct Response {
    std::string                        effective_url;
    long                               status_code = 0;
    std::string                        content_type;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string                        body;
    std::string                        error;
    bool                               success    = false;
    ErrorType                          error_type = ErrorType::None;

    // Case-insensitive; empty when the header is absent.
    std::string header(const std::string& name) const;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/) {}
    virtual void set_request_timeout(std::chrono::milliseconds /*timeout*/) {}

    // May throw on transport failure; callers treat that like an error Response.
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Robocache
