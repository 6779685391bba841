#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Invalid construction parameters (capacity, ttl, missing collaborators).
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& message) : std::invalid_argument(message) {}
};

// KeyCodec could not derive a stable key from the call arguments.
class KeyEncodingError : public std::invalid_argument {
public:
    explicit KeyEncodingError(const std::string& message) : std::invalid_argument(message) {}
};

// A caller's wait on an in-flight computation ran out. The computation keeps running.
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& message) : std::runtime_error(message) {}
};

#endif // CACHEERRORS_HPP
