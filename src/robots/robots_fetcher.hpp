#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <optional>
#include <string>
#include <vector>

#include "../network/http/http_client.hpp"
#include "robots_config.hpp"
#include "rule_set.hpp"

namespace Robocache {
namespace Robots {

using Network::Http::HttpClient;
using Network::Http::Response;

enum class Fault { None, Network, Protocol, Parse };

const char* to_string(Fault fault);

struct FetchOutcome {
    RuleSet                    rules;
    bool                       cacheable = true;
    std::optional<std::string> redirect;  // absolute URL of the one followed hop
    Fault                      fault       = Fault::None;
    long                       status_code = 0;
};

// Fetches /robots.txt for an origin, follows at most one redirect and maps the
// final HTTP outcome to a rule set. Never throws for transport or parse faults.
class RobotsFetcher {
public:
    explicit RobotsFetcher(const RobotsConfig& config);

    boost::asio::awaitable<FetchOutcome> fetch(HttpClient& client, const std::string& url) const;

    static bool is_redirect(long status_code);

private:
    struct Attempt {
        Response    response;
        Fault       fault = Fault::None;
        std::string error;
    };

    bool                     allow_forbidden_;
    std::vector<std::string> agent_names_;

    static boost::asio::awaitable<Attempt> attempt(HttpClient& client, const std::string& url);

    FetchOutcome classify(const std::string&                url,
                          const Attempt&                    result,
                          const std::optional<std::string>& redirect) const;
    FetchOutcome classify_status(const std::string& url, const Response& response) const;
};

}  // namespace Robots
}  // namespace Robocache
