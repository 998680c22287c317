#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Robocache {
namespace Network {
namespace Http {

// Single-shot HTTP/1.1 GET over Beast. Redirects are reported, never followed.
class BeastClient : public HttpClient {
public:
    explicit BeastClient(std::string user_agent = Core::Constants::USER_AGENT);
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::milliseconds timeout) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::string               user_agent_;
    std::chrono::milliseconds connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout_{Core::Constants::REQUEST_TIMEOUT_MS};
    // Longer bodies are truncated, not rejected.
    size_t                    max_body_bytes_ = Core::Constants::MAX_ROBOTS_TXT_BYTES;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    boost::beast::http::request<boost::beast::http::empty_body>
    make_request(const std::string& host_field, const std::string& target) const;

    boost::asio::awaitable<Response> perform_http_request(const std::string& host,
                                                          const std::string& port,
                                                          const std::string& target,
                                                          const std::string& effective_url);
    boost::asio::awaitable<Response> perform_https_request(const std::string& host,
                                                           const std::string& port,
                                                           const std::string& target,
                                                           const std::string& effective_url);

    static Response to_response(boost::beast::http::response<boost::beast::http::string_body>& res,
                                const std::string& effective_url);
};

}  // namespace Http
}  // namespace Network
}  // namespace Robocache
