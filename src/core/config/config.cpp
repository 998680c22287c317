#include "config.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Robocache {
namespace Core {

namespace {

// Agent names come either as a YAML sequence or as one comma-separated string.
std::vector<std::string> agent_list(const std::vector<std::string>& values) {
    std::vector<std::string> agents;
    for (const auto& value : values) {
        for (auto& agent : Utils::Text::split_list(value))
            agents.push_back(agent);
    }
    return agents;
}

void load_cache_tier(const YAML::Node& node, size_t& capacity, long& ttl_seconds) {
    if (!node || !node.IsMap())
        return;
    if (node["capacity"])
        capacity = node["capacity"].as<size_t>();
    if (node["ttl_seconds"])
        ttl_seconds = node["ttl_seconds"].as<long>();
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["agents"]) {
            std::vector<std::string> raw;
            if (yaml["agents"].IsSequence()) {
                for (const auto& node : yaml["agents"])
                    raw.push_back(node.as<std::string>());
            }
            else {
                raw.push_back(yaml["agents"].as<std::string>());
            }
            auto agents = agent_list(raw);
            if (!agents.empty())
                config.agents = agents;
        }
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["allow_forbidden"])
            config.allow_forbidden = yaml["allow_forbidden"].as<bool>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["connect_timeout_ms"])
            config.connect_timeout_ms = yaml["connect_timeout_ms"].as<int>();
        if (yaml["request_timeout_ms"])
            config.request_timeout_ms = yaml["request_timeout_ms"].as<int>();
        if (yaml["verbose"])
            config.verbose = yaml["verbose"].as<bool>();

        load_cache_tier(yaml["success_cache"], config.success_cache_capacity, config.success_cache_ttl);
        load_cache_tier(yaml["error_cache"], config.error_cache_capacity, config.error_cache_ttl);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Robocache - robots.txt resolver with success/error rule caching"};

    std::string agents;

    app.add_option("-a,--agent", agents, "Comma-separated robot agent names matched against robots.txt groups");
    app.add_option("--user-agent", config.user_agent, "User-Agent header sent when fetching");
    app.add_option("-t,--threads", config.threads, "Number of IO threads")->check(CLI::PositiveNumber);
    app.add_option("--success-capacity", config.success_cache_capacity, "Max entries in the success cache");
    app.add_option("--success-ttl", config.success_cache_ttl, "Success cache TTL in seconds");
    app.add_option("--error-capacity", config.error_cache_capacity, "Max entries in the error cache");
    app.add_option("--error-ttl", config.error_cache_ttl, "Error cache TTL in seconds");
    app.add_option("--connect-timeout", config.connect_timeout_ms, "Connect timeout in milliseconds");
    app.add_option("--request-timeout", config.request_timeout_ms, "Request timeout in milliseconds");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    app.add_flag(
        "--forbid-on-403",
        [&](size_t count) {
            if (count > 0)
                config.allow_forbidden = false;
        },
        "Treat HTTP 403 on robots.txt as 'forbid all'");
    app.add_flag("-v,--verbose", config.verbose, "Log cache decisions");

    app.add_option("urls", config.urls, "URLs to check");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        // Explicit flags win over the file.
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (!agents.empty()) {
        auto parsed = Utils::Text::split_list(agents);
        if (!parsed.empty())
            config.agents = parsed;
    }

    return config;
}

}  // namespace Core
}  // namespace Robocache
