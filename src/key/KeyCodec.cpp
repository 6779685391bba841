#include "KeyCodec.hpp"

#include <cmath>
#include <utility>

#include <boost/container_hash/hash.hpp>

namespace {
    // JSON has no representation for these; dump() would silently turn them into null.
    void rejectUnencodable(const nlohmann::json& node, const std::string& path) {
        switch (node.type()) {
            case nlohmann::json::value_t::number_float: {
                double value = node.get<double>();
                if (!std::isfinite(value)) {
                    throw KeyEncodingError("Non-finite number at " + path + " cannot be part of a cache key");
                }
                break;
            }
            case nlohmann::json::value_t::discarded:
                throw KeyEncodingError("Discarded value at " + path + " cannot be part of a cache key");
            case nlohmann::json::value_t::array: {
                std::size_t i = 0;
                for (const auto& element : node) {
                    rejectUnencodable(element, path + "[" + std::to_string(i++) + "]");
                }
                break;
            }
            case nlohmann::json::value_t::object:
                for (const auto& item : node.items()) {
                    rejectUnencodable(item.value(), path + "." + item.key());
                }
                break;
            default:
                break;
        }
    }
}

KeyCodec::KeyCodec(std::string name_space) : name_space_(std::move(name_space)) {}

CacheKey KeyCodec::finalize(const nlohmann::json& arguments) const {
    std::size_t i = 0;
    for (const auto& argument : arguments) {
        rejectUnencodable(argument, "argument " + std::to_string(i++));
    }

    CacheKey key;
    try {
        key.canonical = nlohmann::json::array({name_space_, arguments}).dump();
    } catch (const nlohmann::json::type_error& e) {
        // invalid UTF-8 in a string argument
        throw KeyEncodingError("Cannot canonicalize cache key: " + std::string(e.what()));
    }

    std::size_t seed = 0;
    boost::hash_combine(seed, name_space_);
    boost::hash_combine(seed, key.canonical);
    key.hash = seed;
    return key;
}
