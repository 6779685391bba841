#ifndef KEYCODEC_HPP
#define KEYCODEC_HPP

#include <exception>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "CacheKey.hpp"
#include "../errors/CacheErrors.hpp"

// Derives a CacheKey from a producer's call arguments.
//
// Accepted argument shapes: bool, integers, finite floating point numbers, std::string and
// C strings, nullptr, std::vector / std::list / std::array, std::pair / std::tuple,
// std::map / std::unordered_map with string keys, nlohmann::json values, and any user type
// with a to_json() overload. Objects are serialized with sorted keys, so map iteration order
// does not matter. Unordered sets are not canonical and must be sorted by the caller.
//
// Raw pointers other than C strings are rejected at compile time; NaN/infinity, invalid
// UTF-8 and throwing to_json() overloads raise KeyEncodingError.
class KeyCodec {
public:
    // name_space separates keys of different producers that take identical arguments.
    explicit KeyCodec(std::string name_space = "");

    template <typename... Args>
    CacheKey encode(const Args&... args) const {
        nlohmann::json arguments = nlohmann::json::array();
        try {
            (appendArgument(arguments, args), ...);
        } catch (const std::exception& e) {
            // nlohmann's own conversion errors and anything a user to_json() throws
            throw KeyEncodingError("Cannot encode cache key argument: " + std::string(e.what()));
        }
        return finalize(arguments);
    }

    const std::string& nameSpace() const { return name_space_; }

private:
    template <typename T>
    static void appendArgument(nlohmann::json& arguments, const T& arg) {
        static_assert(!std::is_pointer<T>::value ||
                          std::is_same<std::remove_cv_t<std::remove_pointer_t<T>>, char>::value,
                      "Pointers have no stable identity and cannot be part of a cache key");
        arguments.push_back(nlohmann::json(arg));
    }

    CacheKey finalize(const nlohmann::json& arguments) const;

    std::string name_space_;
};

#endif // KEYCODEC_HPP
