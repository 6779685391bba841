#ifndef CACHESTATS_HPP
#define CACHESTATS_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t evictions = 0;
    std::uint64_t expirations = 0;
    std::uint64_t coalesced = 0;        // callers that joined an in-flight computation
    std::uint64_t producer_failures = 0;
    std::uint64_t wait_timeouts = 0;
    std::size_t size = 0;

    double hitRatio() const {
        const auto lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "CacheStats {" << std::endl
           << "  hits: " << hits << std::endl
           << "  misses: " << misses << std::endl
           << "  evictions: " << evictions << std::endl
           << "  expirations: " << expirations << std::endl
           << "  coalesced: " << coalesced << std::endl
           << "  producer_failures: " << producer_failures << std::endl
           << "  wait_timeouts: " << wait_timeouts << std::endl
           << "  size: " << size << std::endl
           << "}";
        return ss.str();
    }
};

inline void to_json(nlohmann::json& j, const CacheStats& stats) {
    j = nlohmann::json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"evictions", stats.evictions},
        {"expirations", stats.expirations},
        {"coalesced", stats.coalesced},
        {"producer_failures", stats.producer_failures},
        {"wait_timeouts", stats.wait_timeouts},
        {"size", stats.size},
        {"hit_ratio", stats.hitRatio()}};
}

#endif // CACHESTATS_HPP
