#include <atomic>
#include <cmath>
#include <limits>
#include <gtest/gtest.h>
#include <map>
#include <thread>
#include <vector>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"
#include "../../src/proxy/manager/manager.hpp"

using namespace Conduit::Core;
using namespace Conduit::Proxy;

namespace {

ProviderConfig static_provider(const std::string&    name,
                               const std::string&    entries,
                               std::optional<double> price = std::nullopt,
                               std::optional<int>    limit = std::nullopt) {
    ProviderConfig cfg;
    cfg.name              = name;
    cfg.type              = "static_list";
    cfg.price_per_gb      = price;
    cfg.concurrency_limit = limit;
    cfg.options           = {{"entries", entries}};
    return cfg;
}

ProviderConfig moo_dynamic(const std::string&    name,
                           std::optional<double> price = std::nullopt,
                           std::optional<int>    limit = std::nullopt) {
    ProviderConfig cfg;
    cfg.name              = name;
    cfg.type              = "mooproxy";
    cfg.price_per_gb      = price;
    cfg.concurrency_limit = limit;
    cfg.options           = {
        {"host", "gw.moo.io"}, {"port", "7777"}, {"username", "u"}, {"password", "p"}};
    return cfg;
}

class ManagerTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(LOG_NONE); }
    void TearDown() override { Logger::set_level(LOG_ALL); }
};

}  // namespace

TEST_F(ManagerTest, NamedAcquireRespectsLimit) {
    Manager manager({static_provider("dc", "1.1.1.1:80\n2.2.2.2:80", 1.0, 2)});

    auto a = manager.acquire(std::string("dc"));
    auto b = manager.acquire(std::string("dc"));
    EXPECT_EQ(manager.active_count("dc"), 2);

    try {
        manager.acquire(std::string("dc"));
        FAIL() << "expected ConcurrencyLimitError";
    } catch (const ConcurrencyLimitError& e) {
        EXPECT_EQ(e.provider(), "dc");
        EXPECT_EQ(e.limit(), 2);
    }
    EXPECT_EQ(manager.active_count("dc"), 2);

    manager.release(a);
    EXPECT_EQ(manager.active_count("dc"), 1);
    EXPECT_NO_THROW(manager.acquire(std::string("dc")));
    manager.release(b);
}

TEST_F(ManagerTest, RotationContinuesAfterRelease) {
    Manager manager({static_provider("p1", "a:1,b:2", 1.0, 2)});

    auto first  = manager.acquire(std::string("p1"));
    auto second = manager.acquire(std::string("p1"));
    EXPECT_EQ(first.host, "a");
    EXPECT_EQ(second.host, "b");
    EXPECT_THROW(manager.acquire(std::string("p1")), ConcurrencyLimitError);

    manager.release(first);
    auto third = manager.acquire(std::string("p1"));
    EXPECT_EQ(third.host, "a");
    EXPECT_EQ(manager.active_count("p1"), 2);
}

TEST_F(ManagerTest, AutoModeSkipsFullProvider) {
    Manager manager({static_provider("p1", "1.1.1.1:80", 5.0, 1),
                     static_provider("p2", "2.2.2.2:80", 2.0, 1)});
    manager.acquire(std::string("p1"));
    EXPECT_EQ(manager.acquire().provider, "p2");
    EXPECT_EQ(manager.active_count("p1"), 1);
    EXPECT_EQ(manager.active_count("p2"), 1);
}

TEST_F(ManagerTest, ConcurrentAcquireNeverExceedsLimit) {
    Manager manager({moo_dynamic("moo", 2.0, 5)});

    std::atomic<int>         granted{0};
    std::atomic<int>         refused{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 20; ++t) {
        threads.emplace_back([&]() {
            try {
                manager.acquire(std::string("moo"));
                granted++;
            } catch (const ConcurrencyLimitError&) {
                refused++;
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(granted.load(), 5);
    EXPECT_EQ(refused.load(), 15);
    EXPECT_EQ(manager.active_count("moo"), 5);
}

TEST_F(ManagerTest, AutoModePrefersCheapest) {
    Manager manager({static_provider("expensive", "9.9.9.9:80", 10.0),
                     static_provider("cheap", "1.1.1.1:80", 0.5, 1),
                     static_provider("unpriced", "5.5.5.5:80")});

    EXPECT_EQ(manager.acquire().provider, "cheap");
    // cheap is full now, so the next cheapest is used
    EXPECT_EQ(manager.acquire().provider, "expensive");
    EXPECT_EQ(manager.active_count("cheap"), 1);
    EXPECT_EQ(manager.active_count("expensive"), 1);
    EXPECT_EQ(manager.active_count("unpriced"), 0);
}

TEST_F(ManagerTest, AutoModeTieGoesToFirstDeclared) {
    Manager manager(
        {static_provider("first", "1.1.1.1:80", 1.0), static_provider("second", "2.2.2.2:80", 1.0)});
    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(manager.acquire().provider, "first");
}

TEST_F(ManagerTest, AutoModeAllFull) {
    Manager manager({static_provider("a", "1.1.1.1:80", 1.0, 1),
                     static_provider("b", "2.2.2.2:80", 2.0, 1)});
    manager.acquire();
    manager.acquire();
    EXPECT_THROW(manager.acquire(), NoProviderAvailableError);
    EXPECT_EQ(manager.active_count("a"), 1);
    EXPECT_EQ(manager.active_count("b"), 1);
}

TEST_F(ManagerTest, NoProvidersConfigured) {
    Manager manager(std::vector<ProviderConfig>{});
    EXPECT_THROW(manager.acquire(), NoProviderAvailableError);
}

TEST_F(ManagerTest, UnknownProvider) {
    Manager manager({static_provider("a", "1.1.1.1:80")});
    try {
        manager.acquire(std::string("nope"));
        FAIL() << "expected ProviderNotFoundError";
    } catch (const ProviderNotFoundError& e) {
        EXPECT_EQ(std::string(e.what()), "Proxy provider not found: nope");
    }
    EXPECT_THROW(manager.active_count("nope"), ProviderNotFoundError);
}

TEST_F(ManagerTest, GenerationErrorRollsBackReservation) {
    Manager manager({moo_dynamic("moo", 1.0, 1)});
    EXPECT_THROW(manager.acquire(std::string("moo"), std::string("not a region")),
                 ProviderGenerationError);
    EXPECT_EQ(manager.active_count("moo"), 0);
    EXPECT_NO_THROW(manager.acquire(std::string("moo"), std::string("FR")));
    EXPECT_EQ(manager.active_count("moo"), 1);
}

TEST_F(ManagerTest, AutoModeSkipsFailingProvider) {
    Manager manager({moo_dynamic("moo", 0.1), static_provider("dc", "1.1.1.1:80", 5.0)});
    auto    ep = manager.acquire(std::nullopt, std::string("us-east"));
    EXPECT_EQ(ep.provider, "dc");
    EXPECT_EQ(manager.active_count("moo"), 0);
    EXPECT_EQ(manager.active_count("dc"), 1);
}

TEST_F(ManagerTest, ReleaseRestoresCapacity) {
    Manager manager({moo_dynamic("moo", 1.0, 3)});
    std::vector<Endpoint> leased;
    for (int i = 0; i < 3; ++i)
        leased.push_back(manager.acquire(std::string("moo")));
    for (const auto& ep : leased)
        manager.release(ep, std::string("done"));
    EXPECT_EQ(manager.active_count("moo"), 0);

    auto metrics = manager.meter()->get_metrics();
    ASSERT_EQ(metrics.size(), 3u);
    for (const auto& kv : metrics) {
        EXPECT_FALSE(kv.second.active);
        EXPECT_EQ(*kv.second.last_release_reason, "done");
    }
}

TEST_F(ManagerTest, DoubleReleaseIsIgnored) {
    Manager manager({static_provider("dc", "1.1.1.1:80\n2.2.2.2:80", 1.0, 2)});
    auto    a = manager.acquire(std::string("dc"));
    auto    b = manager.acquire(std::string("dc"));

    manager.release(a);
    manager.release(a);
    EXPECT_EQ(manager.active_count("dc"), 1);
    manager.release(b);
    manager.release(b);
    EXPECT_EQ(manager.active_count("dc"), 0);
}

TEST_F(ManagerTest, ForeignReleaseIsIgnored) {
    Manager manager({static_provider("dc", "1.1.1.1:80", 1.0, 1)});
    auto    leased = manager.acquire(std::string("dc"));

    Endpoint stranger = leased;
    stranger.host     = "8.8.8.8";
    manager.release(stranger);
    EXPECT_EQ(manager.active_count("dc"), 1);

    stranger.provider = "ghost";
    EXPECT_NO_THROW(manager.release(stranger));
    EXPECT_EQ(manager.active_count("dc"), 1);
}

TEST_F(ManagerTest, SameStaticEntryLeasedTwice) {
    Manager manager({static_provider("dc", "1.1.1.1:80", 1.0, 2)});
    auto    a = manager.acquire(std::string("dc"));
    auto    b = manager.acquire(std::string("dc"));
    EXPECT_EQ(a.identity_key(), b.identity_key());

    manager.release(a);
    EXPECT_EQ(manager.active_count("dc"), 1);
    auto m = manager.meter()->get_metrics().at(a.identity_key());
    EXPECT_TRUE(m.active);
    EXPECT_EQ(m.outstanding, 1u);

    manager.release(b);
    EXPECT_EQ(manager.active_count("dc"), 0);
    EXPECT_FALSE(manager.meter()->get_metrics().at(a.identity_key()).active);
    manager.release(b);
    EXPECT_EQ(manager.active_count("dc"), 0);
}

TEST_F(ManagerTest, RecordRequestFeedsMeter) {
    Manager manager({static_provider("dc", "1.1.1.1:80", 4.0)});
    auto    ep = manager.acquire(std::nullopt, std::nullopt, std::string("crawl"));
    manager.record_request(ep, 512ull * 1024 * 1024, 512ull * 1024 * 1024, true);

    auto metrics = manager.meter()->get_metrics(std::string("dc"));
    ASSERT_EQ(metrics.size(), 1u);
    const auto& m = metrics.begin()->second;
    EXPECT_EQ(m.purpose, "crawl");
    EXPECT_EQ(m.requests_count, 1u);
    EXPECT_NEAR(m.cost_estimate, 4.0, 1e-9);
}

TEST_F(ManagerTest, StatsReportProviders) {
    Manager manager({static_provider("dc", "1.1.1.1:80", 1.5, 4), moo_dynamic("moo")});
    manager.acquire(std::string("dc"));

    auto stats = manager.get_stats();
    ASSERT_EQ(stats.providers.size(), 2u);
    EXPECT_EQ(stats.providers[0].name, "dc");
    EXPECT_EQ(stats.providers[0].type, "static_list");
    EXPECT_EQ(stats.providers[0].active_count, 1);
    EXPECT_EQ(*stats.providers[0].limit, 4);
    EXPECT_DOUBLE_EQ(*stats.providers[0].price_per_gb, 1.5);
    EXPECT_FALSE(stats.providers[1].limit.has_value());
    EXPECT_FALSE(stats.providers[1].price_per_gb.has_value());
    ASSERT_TRUE(stats.usage.has_value());
    EXPECT_EQ(stats.usage->total_endpoints, 1u);

    std::vector<std::string> names = {"dc", "moo"};
    EXPECT_EQ(manager.provider_names(), names);
    EXPECT_EQ(manager.provider("moo").name(), "moo");
}

TEST_F(ManagerTest, MeteringDisabled) {
    Manager manager({static_provider("dc", "1.1.1.1:80")}, false);
    EXPECT_EQ(manager.meter(), nullptr);
    auto ep = manager.acquire();
    EXPECT_NO_THROW(manager.record_request(ep, 10, 10, true));
    manager.release(ep);
    EXPECT_FALSE(manager.get_stats().usage.has_value());
}

TEST_F(ManagerTest, InvalidProviderFailsConstruction) {
    ProviderConfig bad;
    bad.name = "bd";
    bad.type = "brightdata";
    EXPECT_THROW(Manager({bad}), ConfigurationError);

    ProviderConfig unknown;
    unknown.name = "x";
    unknown.type = "carrier-pigeon";
    EXPECT_THROW(Manager({unknown}), ConfigurationError);
}

TEST_F(ManagerTest, NonFinitePriceFailsConstruction) {
    EXPECT_THROW(Manager({static_provider("nan", "1.1.1.1:80", std::nan(""))}),
                 ConfigurationError);
    EXPECT_THROW(Manager({static_provider("inf", "1.1.1.1:80",
                                          std::numeric_limits<double>::infinity())}),
                 ConfigurationError);
    EXPECT_THROW(Manager({static_provider("neg", "1.1.1.1:80", -0.5)}), ConfigurationError);
}
