#include "robots_fetcher.hpp"
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"

namespace Robocache {
namespace Robots {

using Core::Logger;
using Network::Http::ErrorType;
using Network::Http::HTTPCode;
using Utils::Url;

namespace {

FetchOutcome transient(Fault fault, long status_code) {
    return FetchOutcome{.rules       = RuleSet::empty(),
                        .cacheable   = false,
                        .redirect    = std::nullopt,
                        .fault       = fault,
                        .status_code = status_code};
}

}  // namespace

const char* to_string(Fault fault) {
    switch (fault) {
        case Fault::None: return "none";
        case Fault::Network: return "network";
        case Fault::Protocol: return "protocol";
        case Fault::Parse: return "parse";
    }
    return "unknown";
}

RobotsFetcher::RobotsFetcher(const RobotsConfig& config)
    : allow_forbidden_(config.allow_forbidden), agent_names_(config.agent_names) {
}

bool RobotsFetcher::is_redirect(long status_code) {
    return status_code == static_cast<long>(HTTPCode::MovedPermanently)
           || status_code == static_cast<long>(HTTPCode::Found)
           || status_code == static_cast<long>(HTTPCode::TemporaryRedirect)
           || status_code == static_cast<long>(HTTPCode::PermanentRedirect);
}

boost::asio::awaitable<RobotsFetcher::Attempt> RobotsFetcher::attempt(HttpClient&        client,
                                                                      const std::string& url) {
    Attempt result;
    try {
        result.response = co_await client.get(url);
    } catch (const std::exception& e) {
        result.fault = Fault::Network;
        result.error = e.what();
    }

    if (result.fault == Fault::None && result.response.error_type != ErrorType::None) {
        result.fault = Fault::Network;
        result.error = result.response.error.empty() ? "transport error" : result.response.error;
    }
    co_return result;
}

boost::asio::awaitable<FetchOutcome> RobotsFetcher::fetch(HttpClient&        client,
                                                          const std::string& url) const {
    Attempt                    current = co_await attempt(client, Url::robots_url(url));
    std::optional<std::string> redirect;

    // One level of redirection only.
    if (current.fault == Fault::None && is_redirect(current.response.status_code)) {
        std::string location = Utils::Text::trim(current.response.header("location"));
        if (!location.empty()) {
            // Location should be absolute, but relative ones are common.
            std::string target = Utils::Text::starts_with(Utils::Text::to_lower(location), "http")
                                     ? location
                                     : Url::resolve(url, location);
            if (target.empty() || !Url::is_absolute(target)) {
                current.fault = Fault::Protocol;
                current.error = "unusable redirect location '" + location + "'";
                Logger::warn("Ignoring redirect from " + url + " to '" + location + "'");
            }
            else {
                redirect = target;
                current  = co_await attempt(client, target);
            }
        }
    }

    co_return classify(url, current, redirect);
}

FetchOutcome RobotsFetcher::classify(const std::string&                url,
                                     const Attempt&                    result,
                                     const std::optional<std::string>& redirect) const {
    FetchOutcome outcome = transient(result.fault, result.response.status_code);

    switch (result.fault) {
        case Fault::None: outcome = classify_status(url, result.response); break;
        case Fault::Network:
        case Fault::Protocol:
        case Fault::Parse:
            Logger::info("Couldn't get robots.txt for " + url + " : " + to_string(result.fault)
                         + " fault: " + result.error);
            break;
    }

    outcome.redirect = redirect;
    return outcome;
}

FetchOutcome RobotsFetcher::classify_status(const std::string& url, const Response& response) const {
    const long   code = response.status_code;
    FetchOutcome outcome{.rules = RuleSet::empty(), .cacheable = true, .status_code = code};

    if (code == static_cast<long>(HTTPCode::Ok)) {
        try {
            outcome.rules = RuleSet::parsed(
                Utils::RobotsTxt::parse(url, response.body, response.content_type, agent_names_));
        } catch (const Utils::ParseError& e) {
            Logger::info("Couldn't get robots.txt for " + url + " : parse fault: " + e.what());
            return transient(Fault::Parse, code);
        }
    }
    else if (code == static_cast<long>(HTTPCode::Forbidden) && !allow_forbidden_) {
        outcome.rules = RuleSet::forbid_all();
    }
    else if (code >= static_cast<long>(HTTPCode::ServerError)) {
        // Server currently broken: retry sooner via the error tier.
        outcome.cacheable = false;
    }
    return outcome;
}

}  // namespace Robots
}  // namespace Robocache
