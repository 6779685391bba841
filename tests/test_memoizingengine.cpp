// test/test_memoizingengine.cpp
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "gtest/gtest.h"
#include "gmock/gmock.h"

#include "TestMocks.hpp"
#include "../src/cache/MemoizingEngine.hpp"
#include "../src/clock/FakeClock.hpp"
#include "../src/errors/CacheErrors.hpp"
#include "../src/key/KeyCodec.hpp"

using namespace std::chrono_literals;
using ::testing::NiceMock;

// --- Test Fixture for MemoizingEngine ---
class MemoizingEngineTest : public ::testing::Test {
protected:
    using Engine = MemoizingEngine<std::string, int>;

    std::shared_ptr<FakeClock> clock_ = std::make_shared<FakeClock>();
    std::shared_ptr<NiceMock<MockLogger>> logger_ = makeQuietLogger();
    std::shared_ptr<NiceMock<MockStatsDClient>> statsd_ = makeQuietStatsD();

    std::unique_ptr<Engine> makeEngine(std::size_t capacity, std::optional<std::chrono::milliseconds> ttl) {
        return std::make_unique<Engine>(capacity, ttl, clock_, logger_, statsd_);
    }

    // Producer returning value and counting its invocations.
    static Engine::Producer counting(int value, int& calls) {
        return [value, &calls]() {
            ++calls;
            return value;
        };
    }
};

TEST_F(MemoizingEngineTest, ZeroCapacityIsConfigError) {
    EXPECT_THROW(makeEngine(0, std::nullopt), ConfigError);
}

TEST_F(MemoizingEngineTest, NegativeTtlIsConfigError) {
    EXPECT_THROW(makeEngine(4, std::chrono::milliseconds(-1)), ConfigError);
}

TEST_F(MemoizingEngineTest, NullCollaboratorsAreConfigErrors) {
    EXPECT_THROW(Engine(4, std::nullopt, nullptr, logger_, statsd_), ConfigError);
    EXPECT_THROW(Engine(4, std::nullopt, clock_, nullptr, statsd_), ConfigError);
    EXPECT_THROW(Engine(4, std::nullopt, clock_, logger_, nullptr), ConfigError);
}

TEST_F(MemoizingEngineTest, ComputesOnceThenServesFromCache) {
    auto engine = makeEngine(4, std::nullopt);
    int calls = 0;

    EXPECT_EQ(engine->getOrCompute("a", counting(7, calls)), 7);
    EXPECT_EQ(engine->getOrCompute("a", counting(8, calls)), 7);
    EXPECT_EQ(calls, 1);

    auto stats = engine->stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.size, 1u);
}

// capacity N: insert k1..kN, read k1, insert k(N+1) -> k2 is evicted, not k1.
TEST_F(MemoizingEngineTest, LeastRecentlyUsedKeyIsEvicted) {
    const std::size_t capacity = 3;
    auto engine = makeEngine(capacity, std::nullopt);
    int calls = 0;
    engine->getOrCompute("k1", counting(1, calls));
    engine->getOrCompute("k2", counting(2, calls));
    engine->getOrCompute("k3", counting(3, calls));
    engine->getOrCompute("k1", counting(100, calls));
    engine->getOrCompute("k4", counting(4, calls));

    EXPECT_TRUE(engine->contains("k1"));
    EXPECT_FALSE(engine->contains("k2"));
    EXPECT_TRUE(engine->contains("k3"));
    EXPECT_TRUE(engine->contains("k4"));
    EXPECT_EQ(engine->stats().evictions, 1u);
    EXPECT_EQ(calls, 4);
}

// capacity=2, no ttl: put a, put b, read a, put c -> {a:1, c:3}.
TEST_F(MemoizingEngineTest, PutGetPutScenario) {
    auto engine = makeEngine(2, std::nullopt);
    int calls = 0;
    engine->put("a", 1);
    engine->put("b", 2);
    EXPECT_EQ(engine->getOrCompute("a", counting(-1, calls)), 1);
    engine->put("c", 3);

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(engine->size(), 2u);
    EXPECT_EQ(engine->peek("a"), 1);
    EXPECT_EQ(engine->peek("c"), 3);
    EXPECT_FALSE(engine->peek("b").has_value());
}

TEST_F(MemoizingEngineTest, SizeNeverExceedsCapacity) {
    const std::size_t capacity = 5;
    auto engine = makeEngine(capacity, std::nullopt);
    int calls = 0;
    for (int i = 0; i < 200; ++i) {
        const std::string key = "k" + std::to_string((i * 7) % 23);
        if (i % 3 == 0) {
            engine->put(key, i);
        } else {
            engine->getOrCompute(key, counting(i, calls));
        }
        ASSERT_LE(engine->size(), capacity);
        ASSERT_LE(engine->stats().size, capacity);
    }
}

// ttl=100ms: inserted at t=0, hit at t=99ms, recomputed at t=101ms.
TEST_F(MemoizingEngineTest, TtlBoundary) {
    auto engine = makeEngine(10, 100ms);
    int calls = 0;

    EXPECT_EQ(engine->getOrCompute("x", counting(1, calls)), 1);
    clock_->set(99ms);
    EXPECT_EQ(engine->getOrCompute("x", counting(2, calls)), 1);
    EXPECT_EQ(calls, 1);

    clock_->set(101ms);
    EXPECT_EQ(engine->getOrCompute("x", counting(2, calls)), 2);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(engine->stats().expirations, 1u);
}

// capacity=10, ttl=50ms: 42 computed at t=0, still 42 at t=10ms, 99 at t=60ms.
TEST_F(MemoizingEngineTest, ExpiredEntryIsRecomputed) {
    auto engine = makeEngine(10, 50ms);
    int slow_calls = 0;
    int other_calls = 0;

    EXPECT_EQ(engine->getOrCompute("x", counting(42, slow_calls)), 42);
    clock_->set(10ms);
    EXPECT_EQ(engine->getOrCompute("x", counting(99, other_calls)), 42);
    EXPECT_EQ(other_calls, 0);
    clock_->set(60ms);
    EXPECT_EQ(engine->getOrCompute("x", counting(99, other_calls)), 99);
    EXPECT_EQ(other_calls, 1);
    EXPECT_EQ(slow_calls, 1);
}

TEST_F(MemoizingEngineTest, TtlIsNotRefreshedByReads) {
    auto engine = makeEngine(10, 100ms);
    int calls = 0;
    engine->getOrCompute("x", counting(1, calls));
    for (int t = 20; t <= 80; t += 20) {
        clock_->set(std::chrono::milliseconds(t));
        engine->getOrCompute("x", counting(1, calls));
    }
    clock_->set(100ms);
    EXPECT_FALSE(engine->peek("x").has_value());
    EXPECT_EQ(calls, 1);
}

TEST_F(MemoizingEngineTest, ProducerErrorIsPropagatedAndNotCached) {
    auto engine = makeEngine(4, std::nullopt);
    int calls = 0;
    auto failing = [&calls]() -> int {
        ++calls;
        throw std::runtime_error("backend down");
    };

    try {
        engine->getOrCompute("k", failing);
        FAIL() << "expected the producer's exception";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "backend down");
    }
    EXPECT_FALSE(engine->contains("k"));
    EXPECT_EQ(engine->size(), 0u);
    EXPECT_EQ(engine->inFlight(), 0u);

    EXPECT_EQ(engine->getOrCompute("k", counting(5, calls)), 5);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(engine->stats().producer_failures, 1u);
}

TEST_F(MemoizingEngineTest, ProducerExceptionTypeIsPreserved) {
    auto engine = makeEngine(4, std::nullopt);
    EXPECT_THROW(engine->getOrCompute("k", []() -> int { throw std::out_of_range("no such row"); }),
                 std::out_of_range);
}

TEST_F(MemoizingEngineTest, PeekIsReadOnly) {
    auto engine = makeEngine(2, std::nullopt);
    engine->put("a", 1);
    engine->put("b", 2);
    auto before = engine->stats();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(engine->peek("a"), 1);
    }
    EXPECT_FALSE(engine->peek("missing").has_value());

    auto after = engine->stats();
    EXPECT_EQ(after.size, before.size);
    EXPECT_EQ(after.hits, before.hits);
    EXPECT_EQ(after.misses, before.misses);

    // "a" was only peeked, so it is still the least recently used entry
    engine->put("c", 3);
    EXPECT_FALSE(engine->peek("a").has_value());
    EXPECT_EQ(engine->peek("b"), 2);
}

TEST_F(MemoizingEngineTest, PeekIgnoresExpiredEntriesWithoutRemovingThem) {
    auto engine = makeEngine(4, 10ms);
    engine->put("a", 1);
    clock_->set(10ms);
    EXPECT_FALSE(engine->peek("a").has_value());
    EXPECT_FALSE(engine->contains("a"));
    EXPECT_EQ(engine->size(), 1u);
    EXPECT_EQ(engine->purgeExpired(), 1u);
    EXPECT_EQ(engine->size(), 0u);
}

TEST_F(MemoizingEngineTest, InvalidateAndClear) {
    auto engine = makeEngine(4, std::nullopt);
    int calls = 0;
    engine->getOrCompute("a", counting(1, calls));
    engine->getOrCompute("b", counting(2, calls));

    EXPECT_TRUE(engine->invalidate("a"));
    EXPECT_FALSE(engine->invalidate("a"));
    EXPECT_FALSE(engine->contains("a"));
    EXPECT_EQ(engine->getOrCompute("a", counting(10, calls)), 10);

    engine->clear();
    EXPECT_EQ(engine->size(), 0u);
    EXPECT_EQ(engine->getOrCompute("b", counting(20, calls)), 20);
    EXPECT_EQ(calls, 4);
}

TEST_F(MemoizingEngineTest, PutOverwritesAndRestartsTtl) {
    auto engine = makeEngine(4, 50ms);
    engine->put("a", 1);
    clock_->set(40ms);
    engine->put("a", 2);
    clock_->set(80ms);
    EXPECT_EQ(engine->peek("a"), 2);
    clock_->set(90ms);
    EXPECT_FALSE(engine->peek("a").has_value());
}

TEST_F(MemoizingEngineTest, WorksWithCodecKeys) {
    MemoizingEngine<CacheKey, std::string> engine(8, std::nullopt, clock_, logger_, statsd_);
    KeyCodec codec("describe");
    int calls = 0;
    auto describe = [&calls](int id, const std::string& country) {
        ++calls;
        return std::to_string(id) + "@" + country;
    };

    auto first = engine.getOrCompute(codec.encode(1, "US"), [&]() { return describe(1, "US"); });
    auto again = engine.getOrCompute(codec.encode(1, "US"), [&]() { return describe(1, "US"); });
    auto other = engine.getOrCompute(codec.encode(1, "GB"), [&]() { return describe(1, "GB"); });

    EXPECT_EQ(first, "1@US");
    EXPECT_EQ(again, "1@US");
    EXPECT_EQ(other, "1@GB");
    EXPECT_EQ(calls, 2);
}

TEST_F(MemoizingEngineTest, StatsSerializeToJson) {
    auto engine = makeEngine(4, std::nullopt);
    int calls = 0;
    engine->getOrCompute("a", counting(1, calls));
    engine->getOrCompute("a", counting(1, calls));

    nlohmann::json j = engine->stats();
    EXPECT_EQ(j["hits"], 1);
    EXPECT_EQ(j["misses"], 1);
    EXPECT_EQ(j["size"], 1);
    EXPECT_DOUBLE_EQ(j["hit_ratio"].get<double>(), 0.5);
    EXPECT_NE(engine->stats().to_string().find("hits: 1"), std::string::npos);
}

TEST_F(MemoizingEngineTest, AccessorsReflectConfiguration) {
    auto engine = makeEngine(16, 250ms);
    EXPECT_EQ(engine->capacity(), 16u);
    ASSERT_TRUE(engine->ttl().has_value());
    EXPECT_EQ(*engine->ttl(), 250ms);
    EXPECT_EQ(engine->inFlight(), 0u);
}
