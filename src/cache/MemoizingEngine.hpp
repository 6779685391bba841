#ifndef MEMOIZINGENGINE_HPP
#define MEMOIZINGENGINE_HPP

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "CacheEntry.hpp"
#include "CacheStats.hpp"
#include "Evictor.hpp"
#include "ExpirationPolicy.hpp"
#include "LruCacheStore.hpp"
#include "../config/AppConfig.hpp"
#include "../errors/CacheErrors.hpp"
#include "../interfaces/IClockSource.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

namespace EngineDetail {
    template <class T, class = void>
    struct IsStreamable : std::false_type {};

    template <class T>
    struct IsStreamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
        : std::true_type {};

    template <class T>
    std::string describeKey(const T& key) {
        if constexpr (IsStreamable<T>::value) {
            std::ostringstream os;
            os << key;
            return os.str();
        } else {
            return "<key>";
        }
    }

    inline std::string describeException(const std::exception_ptr& error) {
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "non-standard exception";
        }
    }
}

// Bounded LRU cache with optional TTL that memoizes a keyed computation.
//
// getOrCompute() runs the producer at most once per key while a result is outstanding:
// concurrent callers for the same key join the in-flight computation and receive its value,
// or its exception, unchanged. Failures are never cached. Store mutations happen under one
// mutex; the producer always runs outside it.
//
// Key needs Hash and operator==; Value must be copy constructible.
template <class Key, class Value, class Hash = std::hash<Key>>
class MemoizingEngine {
public:
    using Producer = std::function<Value()>;
    using Store = LruCacheStore<Key, Value, Hash>;
    using Entry = typename Store::Entry;

    // Throws ConfigError for capacity 0, a negative ttl or a null collaborator.
    MemoizingEngine(std::size_t capacity,
                    std::optional<std::chrono::milliseconds> ttl,
                    std::shared_ptr<IClockSource> clock,
                    std::shared_ptr<ILogger> logger,
                    std::shared_ptr<IStatsDClient> statsd_client)
        : store_(capacity),
          ttl_(ttl),
          clock_(std::move(clock)),
          logger_(std::move(logger)),
          statsd_client_(std::move(statsd_client)) {
        if (ttl_ && ttl_->count() < 0) {
            throw ConfigError("Cache ttl cannot be negative: " + std::to_string(ttl_->count()) + "ms");
        }
        if (!clock_) {
            throw ConfigError("Clock cannot be null for MemoizingEngine");
        }
        if (!logger_) {
            throw ConfigError("Logger cannot be null for MemoizingEngine");
        }
        if (!statsd_client_) {
            throw ConfigError("StatsDClient cannot be null for MemoizingEngine");
        }
        logger_->setup("MemoizingEngine initialized with capacity " + std::to_string(capacity) + ", ttl " +
                       (ttl_ ? std::to_string(ttl_->count()) + "ms" : std::string("disabled")));
    }

    MemoizingEngine(const MemoizingEngine&) = delete;
    MemoizingEngine& operator=(const MemoizingEngine&) = delete;
    MemoizingEngine(MemoizingEngine&&) = delete;
    MemoizingEngine& operator=(MemoizingEngine&&) = delete;

    // Returns the cached value for key, or runs producer and caches its result.
    // wait_timeout only applies when waiting on another caller's computation; on expiry this
    // caller gets TimeoutError while the computation carries on for everyone else.
    Value getOrCompute(const Key& key, const Producer& producer,
                       std::optional<std::chrono::milliseconds> wait_timeout = std::nullopt) {
        enum class Role { Hit, Join, Compute, Retry };

        for (;;) {
            Role role = Role::Compute;
            bool expired = false;
            std::optional<Value> cached;
            std::shared_future<Value> joined;
            std::shared_ptr<PendingComputation> pending;
            std::promise<Value> promise;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto now = clock_->now();

                expired = evictor_.reapIfExpired(store_, key, now, policy_);
                if (expired) {
                    ++stats_.expirations;
                }

                const Entry* entry = expired ? nullptr : store_.get(key);
                if (entry != nullptr) {
                    cached = entry->value;
                    store_.touch(key);
                    ++stats_.hits;
                    role = Role::Hit;
                } else if (auto it = pending_.find(key); it != pending_.end()) {
                    joined = it->second->result;
                    if (it->second->superseded) {
                        // The running producer predates an invalidation. Its result must not be
                        // served, and a second producer must not start until it finishes.
                        role = Role::Retry;
                    } else {
                        ++stats_.misses;
                        ++stats_.coalesced;
                        role = Role::Join;
                    }
                } else {
                    pending = std::make_shared<PendingComputation>();
                    pending->result = promise.get_future().share();
                    pending_.emplace(key, pending);
                    ++stats_.misses;
                }
            }

            if (expired) {
                statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION);
                if (logger_->isDebugEnabled()) {
                    logger_->debug("Expired entry dropped on read: " + EngineDetail::describeKey(key));
                }
            }

            switch (role) {
                case Role::Hit:
                    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
                    return std::move(*cached);
                case Role::Join:
                    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
                    statsd_client_->increment(MetricsDefinitions::CACHE_COALESCED);
                    if (logger_->isDebugEnabled()) {
                        logger_->debug("Joining in-flight computation for " + EngineDetail::describeKey(key));
                    }
                    waitForPending(joined, wait_timeout);
                    return joined.get();
                case Role::Retry:
                    if (logger_->isDebugEnabled()) {
                        logger_->debug("Waiting for superseded computation of " + EngineDetail::describeKey(key));
                    }
                    waitForPending(joined, wait_timeout);
                    continue;
                case Role::Compute:
                default:
                    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
                    return computeAndPublish(key, producer, pending, promise);
            }
        }
    }

    // Valid cached value without touching recency or computing anything.
    std::optional<Value> peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Entry* entry = store_.get(key);
        if (entry == nullptr || !policy_.isValid(*entry, clock_->now())) {
            return std::nullopt;
        }
        return entry->value;
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const Entry* entry = store_.get(key);
        return entry != nullptr && policy_.isValid(*entry, clock_->now());
    }

    // Stores value directly, as if a producer had returned it. A computation already in
    // flight for key still answers its existing waiters but no longer writes to the cache.
    void put(const Key& key, Value value) {
        std::vector<Key> evicted;
        std::size_t size_after = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            supersedePendingLocked(key);
            evicted = storeLocked(key, std::move(value));
            size_after = store_.size();
        }
        reportStored(evicted, size_after);
    }

    // Removes key. Returns true if an entry was resident.
    bool invalidate(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        supersedePendingLocked(key);
        return store_.remove(key).has_value();
    }

    void clear() {
        std::size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped = store_.size();
            for (auto& entry : pending_) {
                entry.second->superseded = true;
            }
            store_.clear();
        }
        statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, 0);
        logger_->info("Cache cleared, " + std::to_string(dropped) + " entries dropped");
    }

    // Drops every expired entry. Reads already ignore expired entries; this only frees memory early.
    std::size_t purgeExpired() {
        std::size_t purged = 0;
        std::size_t size_after = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            purged = evictor_.purgeExpired(store_, clock_->now(), policy_);
            stats_.expirations += purged;
            size_after = store_.size();
        }
        if (purged > 0) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRATION, static_cast<int>(purged));
            statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(size_after));
            logger_->debug("Purged " + std::to_string(purged) + " expired entries");
        }
        return purged;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats snapshot = stats_;
        snapshot.size = store_.size();
        return snapshot;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return store_.size();
    }

    std::size_t inFlight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    std::size_t capacity() const { return store_.capacity(); }
    std::optional<std::chrono::milliseconds> ttl() const { return ttl_; }

private:
    struct PendingComputation {
        std::shared_future<Value> result;
        bool superseded = false; // set by invalidate/put/clear: deliver to waiters, do not store
    };

    // Blocks until the computation settles. Throws TimeoutError if wait_timeout runs out first.
    void waitForPending(const std::shared_future<Value>& pending_result,
                        const std::optional<std::chrono::milliseconds>& wait_timeout) {
        if (!wait_timeout) {
            pending_result.wait();
            return;
        }
        if (pending_result.wait_for(*wait_timeout) == std::future_status::timeout) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++stats_.wait_timeouts;
            }
            statsd_client_->increment(MetricsDefinitions::WAIT_TIMEOUT);
            logger_->warn("Gave up waiting for in-flight computation after " +
                          std::to_string(wait_timeout->count()) + "ms");
            throw TimeoutError("Timed out after " + std::to_string(wait_timeout->count()) +
                               "ms waiting for an in-flight computation");
        }
    }

    Value computeAndPublish(const Key& key, const Producer& producer,
                            const std::shared_ptr<PendingComputation>& pending,
                            std::promise<Value>& promise) {
        if (logger_->isDebugEnabled()) {
            logger_->debug("Cache miss, invoking producer for " + EngineDetail::describeKey(key));
        }
        const auto started = std::chrono::steady_clock::now();

        std::optional<Value> result;
        try {
            result.emplace(producer());
        } catch (...) {
            const auto error = std::current_exception();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                releasePendingLocked(key, pending);
                ++stats_.producer_failures;
            }
            promise.set_exception(error);
            statsd_client_->increment(MetricsDefinitions::PRODUCER_ERROR);
            logger_->warn("Producer failed for " + EngineDetail::describeKey(key) + ", not caching: " +
                          EngineDetail::describeException(error));
            throw;
        }
        statsd_client_->timing(MetricsDefinitions::PRODUCER_LATENCY,
                               std::chrono::duration_cast<std::chrono::milliseconds>(
                                   std::chrono::steady_clock::now() - started));

        std::vector<Key> evicted;
        std::size_t size_after = 0;
        bool stored = false;
        try {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!pending->superseded) {
                    evicted = storeLocked(key, *result);
                    stored = true;
                }
                releasePendingLocked(key, pending);
                size_after = store_.size();
            }
            promise.set_value(*result);
        } catch (...) {
            // Waiters and later callers must never be left on an unsettled computation.
            const auto error = std::current_exception();
            {
                std::lock_guard<std::mutex> lock(mutex_);
                releasePendingLocked(key, pending);
            }
            promise.set_exception(error);
            logger_->warn("Could not publish result for " + EngineDetail::describeKey(key) + ": " +
                          EngineDetail::describeException(error));
            throw;
        }

        if (stored) {
            reportStored(evicted, size_after);
        } else if (logger_->isDebugEnabled()) {
            logger_->debug("Result for " + EngineDetail::describeKey(key) +
                           " was invalidated while computing, not stored");
        }
        return std::move(*result);
    }

    std::vector<Key> storeLocked(const Key& key, Value value) {
        const auto now = clock_->now();
        store_.put(Entry{key, std::move(value), now, ExpirationPolicy::expiryFor(now, ttl_)});
        std::vector<Key> evicted = evictor_.enforceCapacity(store_);
        stats_.evictions += evicted.size();
        return evicted;
    }

    void reportStored(const std::vector<Key>& evicted, std::size_t size_after) {
        if (!evicted.empty()) {
            statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION, static_cast<int>(evicted.size()));
            if (logger_->isDebugEnabled()) {
                for (const auto& victim : evicted) {
                    logger_->debug("Evicted least recently used entry " + EngineDetail::describeKey(victim));
                }
            }
        }
        statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(size_after));
    }

    // Only the computation that registered itself may unregister; a newer one may own the slot.
    void releasePendingLocked(const Key& key, const std::shared_ptr<PendingComputation>& pending) {
        auto it = pending_.find(key);
        if (it != pending_.end() && it->second == pending) {
            pending_.erase(it);
        }
    }

    // The record stays registered until its producer returns, so no second producer starts meanwhile.
    void supersedePendingLocked(const Key& key) {
        auto it = pending_.find(key);
        if (it != pending_.end()) {
            it->second->superseded = true;
        }
    }

    mutable std::mutex mutex_;
    Store store_;
    std::unordered_map<Key, std::shared_ptr<PendingComputation>, Hash> pending_;
    ExpirationPolicy policy_;
    Evictor<Key, Value, Hash> evictor_;
    CacheStats stats_;

    const std::optional<std::chrono::milliseconds> ttl_;
    std::shared_ptr<IClockSource> clock_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // MEMOIZINGENGINE_HPP
