#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "network/http/beast_client.hpp"
#include "robots/robots_resolver.hpp"

namespace {

using Robocache::Core::Config;
using Robocache::Core::Logger;
using Robocache::Network::Http::BeastClient;
using Robocache::Robots::RobotsConfig;
using Robocache::Robots::RobotsResolver;
using Robocache::Robots::RuleSet;

std::mutex output_mutex;

RobotsConfig make_robots_config(const Config& config) {
    RobotsConfig robots;
    robots.allow_forbidden        = config.allow_forbidden;
    robots.agent_names            = config.agents;
    robots.success_cache.capacity = config.success_cache_capacity;
    robots.success_cache.ttl      = std::chrono::seconds(config.success_cache_ttl);
    robots.error_cache.capacity   = config.error_cache_capacity;
    robots.error_cache.ttl        = std::chrono::seconds(config.error_cache_ttl);
    return robots;
}

void report(const std::string& url, const RuleSet& rules) {
    std::ostringstream line;
    line << (rules.is_allowed(url) ? "ALLOWED " : "BLOCKED ") << url;
    double delay = rules.crawl_delay();
    if (delay > 0.0)
        line << " (crawl-delay " << delay << "s)";
    if (rules.from_cache())
        line << " [cached]";

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << line.str() << std::endl;
}

boost::asio::awaitable<void> check_url(RobotsResolver& resolver, const Config& config, std::string url) {
    BeastClient client(config.user_agent);
    client.set_connect_timeout(std::chrono::milliseconds(config.connect_timeout_ms));
    client.set_request_timeout(std::chrono::milliseconds(config.request_timeout_ms));

    RuleSet rules = co_await resolver.resolve(client, url);
    report(url, rules);
}

void run(const Config& config) {
    RobotsResolver          resolver(make_robots_config(config));
    boost::asio::io_context ioc;

    for (const auto& url : config.urls) {
        boost::asio::co_spawn(ioc, check_url(resolver, config, url), boost::asio::detached);
    }

    std::vector<std::thread> io_threads;
    for (int i = 1; i < config.threads; ++i) {
        io_threads.emplace_back([&ioc]() { ioc.run(); });
    }
    ioc.run();
    for (auto& t : io_threads) {
        if (t.joinable())
            t.join();
    }

    Logger::success("Checked " + std::to_string(config.urls.size()) + " URL(s)");
    if (!Logger::enabled(Robocache::Core::LOG_DEBUG))
        return;

    auto success = resolver.cache().success_tier().stats();
    auto error   = resolver.cache().error_tier().stats();
    Logger::debug("Success cache: " + std::to_string(success.entries) + " entries, "
                  + std::to_string(success.hits) + " hits");
    Logger::debug("Error cache: " + std::to_string(error.entries) + " entries, "
                  + std::to_string(error.hits) + " hits");
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::runtime_error& e) {
        Logger::error(e.what());
        return 1;
    }

    Logger::set_level(config.verbose ? Robocache::Core::LOG_ALL : Robocache::Core::LOG_DEFAULT);

    if (config.urls.empty()) {
        Logger::error("No URLs provided.");
        return 1;
    }

    run(config);
    return 0;
}
