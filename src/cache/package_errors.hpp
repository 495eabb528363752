#pragma once

#include <stdexcept>
#include <string>

namespace remex::cache {

// A request whose artifact bundle cannot be used. Kind() names the cause so a
// requester can tell "never built" from "built but corrupt".
class PackageError : public std::runtime_error {
public:
    PackageError(std::string kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(std::move(kind)) {}

    const std::string& Kind() const { return kind_; }

private:
    std::string kind_;
};

class CacheMissError : public PackageError {
public:
    explicit CacheMissError(const std::string& hash)
        : PackageError("cache-miss", "Tried to get executable from cache, but got a cache miss: " + hash) {}
};

class CachePackageError : public PackageError {
public:
    explicit CachePackageError(const std::string& message)
        : PackageError("cache-corrupt", "Cache package is unusable: " + message) {}
};

class UnpackError : public PackageError {
public:
    explicit UnpackError(const std::string& message)
        : PackageError("unpack-failed", "Failed to unpack cache package: " + message) {}
};

}  // namespace remex::cache
