#ifndef CACHEKEY_HPP
#define CACHEKEY_HPP

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

// Key produced by KeyCodec. The hash only picks the bucket; equality compares the
// full canonical text, so two different argument tuples can never be mistaken for each other.
struct CacheKey {
    std::size_t hash = 0;
    std::string canonical;

    bool operator==(const CacheKey& other) const {
        return hash == other.hash && canonical == other.canonical;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const CacheKey& key) {
    return os << key.canonical;
}

namespace std {
template <>
struct hash<CacheKey> {
    std::size_t operator()(const CacheKey& key) const noexcept { return key.hash; }
};
} // namespace std

#endif // CACHEKEY_HPP
