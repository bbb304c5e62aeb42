#include <gtest/gtest.h>
#include "distribution/distribution_cache.hpp"
#include "distribution/distribution_engine.hpp"
#include "common/errors.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace kchoice;

namespace {

DistributionCache::Entry singleton(size_t n, double mass) {
    auto dist = std::make_shared<Distribution>();
    dist->emplace(Selection(n), mass);
    return dist;
}

} // namespace

// ─── Distribution Cache ────────────────────────────────────────

TEST(CacheTest, ComputesOncePerKey) {
    DistributionCache cache;
    ScoringParams params;
    int calls = 0;
    auto compute = [&]() {
        calls++;
        return singleton(2, 1.0);
    };

    auto first = cache.getOrCompute(3, params, compute);
    auto second = cache.getOrCompute(3, params, compute);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.computed(), 1u);
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_TRUE(cache.contains(3, params));
}

TEST(CacheTest, ParametersArePartOfTheKey) {
    DistributionCache cache;
    ScoringParams a;
    ScoringParams b;
    b.delta = 2.0;

    cache.getOrCompute(0, a, [] { return singleton(1, 1.0); });
    cache.getOrCompute(0, b, [] { return singleton(1, 1.0); });
    cache.getOrCompute(1, a, [] { return singleton(1, 1.0); });

    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_FALSE(cache.contains(1, b));
}

TEST(CacheTest, FailureIsRethrownToEveryCaller) {
    DistributionCache cache;
    ScoringParams params;
    int calls = 0;
    auto failing = [&]() -> DistributionCache::Entry {
        calls++;
        throw NumericDriftError("mass drifted");
    };

    EXPECT_THROW(cache.getOrCompute(0, params, failing), NumericDriftError);
    EXPECT_THROW(cache.getOrCompute(0, params, failing), NumericDriftError);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(cache.computed(), 0u);
}

TEST(CacheTest, ClearInvalidatesEverything) {
    DistributionCache cache;
    ScoringParams params;
    cache.getOrCompute(0, params, [] { return singleton(1, 1.0); });
    cache.getOrCompute(0, params, [] { return singleton(1, 1.0); });

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_EQ(cache.hits(), 0u);
    EXPECT_FALSE(cache.contains(0, params));
}

TEST(CacheTest, ConcurrentCallersShareOneComputation) {
    DistributionCache cache;
    ScoringParams params;
    std::atomic<int> calls{0};

    std::vector<std::thread> threads;
    std::vector<DistributionCache::Entry> results(8);
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t]() {
            results[t] = cache.getOrCompute(7, params, [&]() {
                calls++;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
                return singleton(3, 1.0);
            });
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(calls.load(), 1);
    for (const auto& r : results) {
        EXPECT_EQ(r.get(), results[0].get());
    }
}

// ─── Engine Under Concurrency ──────────────────────────────────

TEST(CacheTest, ConcurrentQueriesMatchSequential) {
    std::vector<double> values = {4.0, 7.0, 3.0, 9.0, 5.0, 6.0, 2.0, 8.0};
    std::vector<double> weights = {2.0, 4.0, 1.0, 5.0, 3.0, 3.0, 1.0, 4.0};
    ScoringParams params{0.4, 0.3, 0.2, 1.5};

    auto reference_instance = KnapsackInstance::create(values, weights, 12.0);
    DistributionEngine reference(reference_instance);
    Distribution expected = reference.getDistribution(params);

    auto instance = KnapsackInstance::create(values, weights, 12.0);
    DistributionEngine engine(instance);

    std::vector<Distribution> results(6);
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; t++) {
        threads.emplace_back([&, t]() { results[t] = engine.getDistribution(params); });
    }
    for (auto& th : threads) th.join();

    for (const auto& r : results) {
        EXPECT_EQ(r, expected);
    }
    EXPECT_EQ(engine.stats().nodes_created, reference.stats().nodes_created);
    EXPECT_EQ(engine.stats().distributions_computed, reference.stats().distributions_computed);
}
