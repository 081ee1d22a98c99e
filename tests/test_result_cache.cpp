#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "core/errors.hpp"
#include "engine/result_cache.hpp"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace riskengine;
using namespace riskengine::engine;
using Catch::Matchers::WithinAbs;

namespace
{
    AnalysisPtr make_result(double volatility)
    {
        auto r = std::make_shared<risk::RiskAnalysisResult>();
        r->decomposition.volatility = volatility;
        return r;
    }

    // Manually advanced time source
    struct FakeClock
    {
        std::shared_ptr<std::chrono::steady_clock::time_point> t =
            std::make_shared<std::chrono::steady_clock::time_point>();

        void advance(std::chrono::seconds s) { *t += s; }

        InMemoryResultCache::Clock source() const
        {
            auto shared = t;
            return [shared]() { return *shared; };
        }
    };
} // namespace

TEST_CASE("Hits and misses", "[ResultCache]")
{
    InMemoryResultCache cache;
    int calls = 0;
    auto compute = [&calls]()
    {
        ++calls;
        return make_result(0.2);
    };

    auto first = cache.get_or_compute("fp1", "fp1", {"proxies"}, compute);
    auto second = cache.get_or_compute("fp1", "fp1", {"proxies"}, compute);

    REQUIRE(calls == 1);
    REQUIRE(first == second);
    REQUIRE(second->decomposition.volatility == 0.2);

    auto stats = cache.stats();
    REQUIRE(stats.misses == 1);
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.entries == 1);
    REQUIRE_THAT(stats.hit_rate(), WithinAbs(0.5, 1e-15));
    REQUIRE(cache.get_name() == "InMemoryResultCache");
}

TEST_CASE("A shared fingerprint with a different request is not served from the cache", "[ResultCache]")
{
    InMemoryResultCache cache;
    int calls = 0;

    auto first = cache.get_or_compute("fp", R"({"portfolio":"A"})", {}, [&calls]()
                                      {
                                          ++calls;
                                          return make_result(0.1);
                                      });
    auto other = cache.get_or_compute("fp", R"({"portfolio":"B"})", {}, [&calls]()
                                      {
                                          ++calls;
                                          return make_result(0.3);
                                      });

    REQUIRE(calls == 2);
    REQUIRE(other->decomposition.volatility == 0.3);

    // The original entry is still served to its own request
    auto again = cache.get_or_compute("fp", R"({"portfolio":"A"})", {}, []() { return make_result(0.9); });
    REQUIRE(again == first);

    auto stats = cache.stats();
    REQUIRE(stats.collisions == 1);
    REQUIRE(stats.hits == 1);
    REQUIRE(stats.entries == 1);
}

TEST_CASE("Entries expire after the TTL", "[ResultCache]")
{
    FakeClock clock;
    InMemoryResultCache cache(std::chrono::seconds(60), 100, clock.source());
    int calls = 0;
    auto compute = [&calls]()
    {
        ++calls;
        return make_result(0.1);
    };

    cache.get_or_compute("fp", "fp", {}, compute);
    clock.advance(std::chrono::seconds(59));
    cache.get_or_compute("fp", "fp", {}, compute);
    REQUIRE(calls == 1);

    clock.advance(std::chrono::seconds(1));
    cache.get_or_compute("fp", "fp", {}, compute);
    REQUIRE(calls == 2);
    REQUIRE(cache.stats().evictions == 1);
}

TEST_CASE("Capacity evicts the oldest entry", "[ResultCache]")
{
    FakeClock clock;
    InMemoryResultCache cache(std::chrono::seconds(900), 2, clock.source());

    for (const auto &fp : {"a", "b", "c"})
    {
        cache.get_or_compute(fp, fp, {}, []() { return make_result(0.1); });
        clock.advance(std::chrono::seconds(1));
    }

    auto stats = cache.stats();
    REQUIRE(stats.entries == 2);
    REQUIRE(stats.evictions == 1);

    int calls = 0;
    cache.get_or_compute("a", "a", {}, [&calls]()
                         {
                             ++calls;
                             return make_result(0.1);
                         });
    REQUIRE(calls == 1);
}

TEST_CASE("Invalidation", "[ResultCache]")
{
    InMemoryResultCache cache;
    cache.get_or_compute("fp1", "fp1", {"proxies-A", "limits-X"}, []() { return make_result(0.1); });
    cache.get_or_compute("fp2", "fp2", {"proxies-A", "limits-Y"}, []() { return make_result(0.2); });
    cache.get_or_compute("fp3", "fp3", {"proxies-B", "limits-Y"}, []() { return make_result(0.3); });

    SECTION("One fingerprint")
    {
        REQUIRE(cache.invalidate(std::string("fp2")) == 1);
        REQUIRE(cache.invalidate(std::string("missing")) == 0);
        REQUIRE(cache.stats().entries == 2);
    }

    SECTION("Everything")
    {
        REQUIRE(cache.invalidate(std::nullopt) == 3);
        REQUIRE(cache.stats().entries == 0);
    }

    SECTION("Every entry built on a component")
    {
        REQUIRE(cache.invalidate_component("proxies-A") == 2);
        REQUIRE(cache.invalidate_component("limits-Y") == 1);
        REQUIRE(cache.stats().entries == 0);
        REQUIRE(cache.stats().evictions == 3);
    }
}

TEST_CASE("Failed computations are not cached", "[ResultCache]")
{
    InMemoryResultCache cache;

    REQUIRE_THROWS_AS(cache.get_or_compute("fp", "fp", {}, []() -> AnalysisPtr
                                           { throw DataInsufficientError("no history"); }),
                      DataInsufficientError);
    REQUIRE(cache.stats().entries == 0);

    int calls = 0;
    cache.get_or_compute("fp", "fp", {}, [&calls]()
                         {
                             ++calls;
                             return make_result(0.1);
                         });
    REQUIRE(calls == 1);
}

TEST_CASE("Concurrent identical requests share one computation", "[ResultCache][Concurrency]")
{
    InMemoryResultCache cache;
    std::atomic<int> calls{0};
    std::atomic<bool> release{false};

    auto compute = [&calls, &release]()
    {
        ++calls;
        while (!release.load())
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return make_result(0.15);
    };

    constexpr int kThreads = 8;
    std::vector<AnalysisPtr> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back([&cache, &results, &compute, i]()
                             { results[static_cast<size_t>(i)] = cache.get_or_compute("fp", "fp", {}, compute); });
    }

    // Every thread has either started the computation or joined it
    while (cache.stats().misses + cache.stats().joins < static_cast<size_t>(kThreads))
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release = true;

    for (auto &t : threads)
    {
        t.join();
    }

    REQUIRE(calls.load() == 1);
    REQUIRE(cache.stats().misses == 1);
    REQUIRE(cache.stats().joins == static_cast<size_t>(kThreads - 1));
    for (const auto &r : results)
    {
        REQUIRE(r == results.front());
    }
}

TEST_CASE("Joined callers see the failure", "[ResultCache][Concurrency]")
{
    InMemoryResultCache cache;
    std::atomic<bool> release{false};
    std::atomic<bool> owner_failed{false};

    std::thread owner([&cache, &release, &owner_failed]()
                      {
                          try
                          {
                              cache.get_or_compute("fp", "fp", {}, [&release]() -> AnalysisPtr
                                                   {
                                                       while (!release.load())
                                                       {
                                                           std::this_thread::sleep_for(std::chrono::milliseconds(1));
                                                       }
                                                       throw DataUnavailable("feed down");
                                                   });
                          }
                          catch (const DataUnavailable &)
                          {
                              owner_failed = true;
                          }
                      });

    while (cache.stats().misses == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::atomic<bool> joined_failed{false};
    std::thread joiner([&cache, &joined_failed]()
                       {
                           try
                           {
                               cache.get_or_compute("fp", "fp", {}, []() { return make_result(0.1); });
                           }
                           catch (const DataUnavailable &)
                           {
                               joined_failed = true;
                           }
                       });

    while (cache.stats().joins == 0)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    release = true;

    owner.join();
    joiner.join();
    REQUIRE(owner_failed.load());
    REQUIRE(joined_failed.load());
    REQUIRE(cache.stats().entries == 0);
}

TEST_CASE("TTL must be positive", "[ResultCache]")
{
    REQUIRE_THROWS_AS(InMemoryResultCache(std::chrono::seconds(0)), ConfigurationError);
}
