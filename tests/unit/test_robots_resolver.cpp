#include <gtest/gtest.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <atomic>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"
#include "../../src/robots/cache_key.hpp"
#include "../../src/robots/robots_resolver.hpp"
#include "mock_http_client.hpp"

using namespace Robocache::Robots;
using Robocache::Testing::MockHttpClient;
using Robocache::Testing::run_blocking;
using namespace std::chrono_literals;

namespace {
const std::string PAGE   = "http://example.com/index.html";
const std::string ROBOTS = "http://example.com/robots.txt";
const std::string KEY    = "http:example.com:80";
const std::string RULES  = "User-agent: *\nDisallow: /private\n";
}  // namespace

class RobotsResolverTest : public ::testing::Test {
protected:
    void SetUp() override { Robocache::Core::Logger::set_level(Robocache::Core::LOG_NONE); }
    void TearDown() override { Robocache::Core::Logger::set_level(Robocache::Core::LOG_DEFAULT); }

    RuleSet resolve(RobotsResolver& resolver, const std::string& url) {
        auto rules = run_blocking(resolver.resolve(client, url));
        EXPECT_TRUE(rules.has_value());
        return rules.value_or(RuleSet::empty());
    }

    MockHttpClient client;
};

// Scenario A
TEST_F(RobotsResolverTest, ParsedRulesAreCachedInSuccessTier) {
    client.on(ROBOTS, 200, RULES);
    RobotsResolver resolver{RobotsConfig()};

    RuleSet first = resolve(resolver, PAGE);
    EXPECT_FALSE(first.from_cache());
    EXPECT_FALSE(first.is_allowed("http://example.com/private"));
    EXPECT_TRUE(first.is_allowed("http://example.com/public"));
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
    EXPECT_FALSE(resolver.cache().error_tier().contains(KEY));

    RuleSet second = resolve(resolver, "http://EXAMPLE.com/other?page=2");
    EXPECT_TRUE(second.from_cache());
    EXPECT_TRUE(second.same_policy(first));
    EXPECT_FALSE(second.is_allowed("http://example.com/private"));
    EXPECT_EQ(client.calls(), 1);
}

// Scenario B
TEST_F(RobotsResolverTest, ForbiddenBlocksEverythingWhenNotAllowed) {
    RobotsConfig config;
    config.allow_forbidden = false;
    client.on(ROBOTS, 403);
    RobotsResolver resolver(config);

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_FALSE(rules.is_allowed("http://example.com/"));
    EXPECT_FALSE(rules.is_allowed("http://example.com/any/path"));
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
}

// Scenario C
TEST_F(RobotsResolverTest, ForbiddenAllowsEverythingByDefault) {
    client.on(ROBOTS, 403);
    RobotsResolver resolver{RobotsConfig()};

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_TRUE(rules.is_allowed("http://example.com/any/path"));
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
}

// Scenario D
TEST_F(RobotsResolverTest, CrossHostRedirectCachesBothOrigins) {
    client.redirect(ROBOTS, 301, "http://other-host/robots.txt");
    client.on("http://other-host/robots.txt", 200, RULES);
    RobotsResolver resolver{RobotsConfig()};

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_FALSE(rules.is_allowed("http://example.com/private"));

    auto original   = resolver.cache().success_tier().get(KEY);
    auto redirected = resolver.cache().success_tier().get("http:other-host:80");
    ASSERT_TRUE(original.has_value());
    ASSERT_TRUE(redirected.has_value());
    EXPECT_TRUE(original->same_policy(*redirected));
    EXPECT_TRUE(original->same_policy(rules));

    RuleSet other = resolve(resolver, "http://other-host/page");
    EXPECT_TRUE(other.from_cache());
    EXPECT_EQ(client.calls(), 2);
}

TEST_F(RobotsResolverTest, SameHostRedirectCachesOneOrigin) {
    client.redirect(ROBOTS, 302, "/en/robots.txt");
    client.on("http://example.com/en/robots.txt", 200, RULES);
    RobotsResolver resolver{RobotsConfig()};

    resolve(resolver, PAGE);
    EXPECT_EQ(resolver.cache().success_tier().size(), 1u);
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
}

TEST_F(RobotsResolverTest, TrailingDotHostIsItsOwnOrigin) {
    client.redirect(ROBOTS, 301, "http://example.com./robots.txt");
    client.on("http://example.com./robots.txt", 200, RULES);
    RobotsResolver resolver{RobotsConfig()};

    resolve(resolver, PAGE);
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
    EXPECT_TRUE(resolver.cache().success_tier().contains("http:example.com.:80"));

    RuleSet rules = resolve(resolver, "http://example.com./page");
    EXPECT_TRUE(rules.from_cache());
    EXPECT_EQ(client.calls(), 2);
}

// Scenario E
TEST_F(RobotsResolverTest, NetworkFaultGoesToErrorTier) {
    client.fail(ROBOTS, "connection refused");
    RobotsResolver resolver{RobotsConfig()};

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_FALSE(rules.from_cache());
    EXPECT_TRUE(rules.same_policy(RuleSet::empty()));
    EXPECT_TRUE(resolver.cache().error_tier().contains(KEY));
    EXPECT_FALSE(resolver.cache().success_tier().contains(KEY));

    RuleSet again = resolve(resolver, PAGE);
    EXPECT_TRUE(again.from_cache());
    EXPECT_EQ(client.calls(), 1);
}

// Scenario F
TEST_F(RobotsResolverTest, ServerErrorGoesToErrorTier) {
    client.on(ROBOTS, 503);
    RobotsResolver resolver{RobotsConfig()};

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_TRUE(rules.is_allowed("http://example.com/anything"));
    EXPECT_TRUE(resolver.cache().error_tier().contains(KEY));
    EXPECT_FALSE(resolver.cache().success_tier().contains(KEY));
}

TEST_F(RobotsResolverTest, NotFoundGoesToSuccessTier) {
    RobotsResolver resolver{RobotsConfig()};
    RuleSet        rules = resolve(resolver, PAGE);
    EXPECT_TRUE(rules.is_allowed("http://example.com/anything"));
    EXPECT_TRUE(resolver.cache().success_tier().contains(KEY));
}

TEST_F(RobotsResolverTest, RedirectThenFaultCachesBothOriginsInErrorTier) {
    client.redirect(ROBOTS, 301, "http://other-host/robots.txt");
    client.on("http://other-host/robots.txt", 500);
    RobotsResolver resolver{RobotsConfig()};

    resolve(resolver, PAGE);
    EXPECT_TRUE(resolver.cache().error_tier().contains(KEY));
    EXPECT_TRUE(resolver.cache().error_tier().contains("http:other-host:80"));
    EXPECT_EQ(resolver.cache().success_tier().size(), 0u);
}

// A stale failure wins over a live success entry for the same origin.
TEST_F(RobotsResolverTest, ErrorTierShadowsSuccessTier) {
    RobotsResolver resolver{RobotsConfig()};
    resolver.cache().store(KEY, RuleSet::forbid_all().with_from_cache(true), CacheTier::Success);
    resolver.cache().store(KEY, RuleSet::empty().with_from_cache(true), CacheTier::Error);

    RuleSet rules = resolve(resolver, PAGE);
    EXPECT_TRUE(rules.from_cache());
    EXPECT_TRUE(rules.same_policy(RuleSet::empty()));
    EXPECT_EQ(client.calls(), 0);
}

TEST_F(RobotsResolverTest, ExpiredErrorEntryIsRetried) {
    RobotsConfig config;
    config.error_cache.ttl = 0s;
    client.on(ROBOTS, 503);
    RobotsResolver resolver(config);

    resolve(resolver, PAGE);
    resolve(resolver, PAGE);
    EXPECT_EQ(client.calls(), 2);
}

TEST_F(RobotsResolverTest, SuccessTierCapacityIsBounded) {
    RobotsConfig config;
    config.success_cache.capacity = 2;
    RobotsResolver resolver(config);

    resolve(resolver, "http://a.com/");
    resolve(resolver, "http://b.com/");
    resolve(resolver, "http://c.com/");
    EXPECT_EQ(resolver.cache().success_tier().size(), 2u);

    resolve(resolver, "http://a.com/");
    EXPECT_EQ(client.calls("http://a.com/robots.txt"), 2);
}

TEST_F(RobotsResolverTest, DistinctPortsAreDistinctOrigins) {
    RobotsResolver resolver{RobotsConfig()};
    resolve(resolver, "http://example.com/");
    resolve(resolver, "http://example.com:80/x");
    resolve(resolver, "http://example.com:8080/");
    EXPECT_EQ(client.calls(), 2);
}

TEST_F(RobotsResolverTest, SharedCacheIsVisibleAcrossResolvers) {
    client.on(ROBOTS, 200, RULES);
    auto           cache = std::make_shared<RulesCache>(RobotsConfig());
    RobotsResolver first(RobotsConfig(), cache);
    RobotsResolver second(RobotsConfig(), cache);

    resolve(first, PAGE);
    RuleSet rules = resolve(second, PAGE);
    EXPECT_TRUE(rules.from_cache());
    EXPECT_EQ(client.calls(), 1);
}

TEST_F(RobotsResolverTest, NullCacheIsRejected) {
    EXPECT_THROW(RobotsResolver(RobotsConfig(), nullptr), std::invalid_argument);
}

TEST_F(RobotsResolverTest, IsAllowed) {
    client.on(ROBOTS, 200, RULES);
    RobotsResolver resolver{RobotsConfig()};

    EXPECT_EQ(run_blocking(resolver.is_allowed(client, "http://example.com/robots.txt")), true);
    EXPECT_EQ(client.calls(), 0);
    EXPECT_EQ(run_blocking(resolver.is_allowed(client, "http://example.com/private/x")), false);
    EXPECT_EQ(run_blocking(resolver.is_allowed(client, "http://example.com/public")), true);
    EXPECT_EQ(client.calls(), 1);
}

TEST_F(RobotsResolverTest, ConcurrentResolvesAcrossThreads) {
    constexpr int ORIGINS  = 10;
    constexpr int REQUESTS = 200;
    for (int i = 0; i < ORIGINS; ++i)
        client.on("http://host" + std::to_string(i) + ".com/robots.txt", 200, RULES);

    RobotsResolver          resolver{RobotsConfig()};
    boost::asio::io_context io_context;
    std::atomic<int>        blocked{0};
    std::atomic<int>        done{0};

    for (int i = 0; i < REQUESTS; ++i) {
        std::string url = "http://host" + std::to_string(i % ORIGINS) + ".com/private/" + std::to_string(i);
        boost::asio::co_spawn(
            io_context,
            [&, url]() -> boost::asio::awaitable<void> {
                RuleSet rules = co_await resolver.resolve(client, url);
                if (!rules.is_allowed(url))
                    ++blocked;
                ++done;
            },
            boost::asio::detached);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
        threads.emplace_back([&io_context]() { io_context.run(); });
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(done.load(), REQUESTS);
    EXPECT_EQ(blocked.load(), REQUESTS);
    EXPECT_EQ(resolver.cache().success_tier().size(), static_cast<size_t>(ORIGINS));
    EXPECT_GE(client.calls(), ORIGINS);
    EXPECT_LE(client.calls(), REQUESTS);
}
