#ifndef CACHEEXCEPTIONS_HPP
#define CACHEEXCEPTIONS_HPP

#include <stdexcept>
#include <string>

// Raised when a dependency file is missing at the time it is registered.
class FileNotFoundException : public std::runtime_error {
public:
    explicit FileNotFoundException(const std::string& path)
        : std::runtime_error("Dependency file not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Raised by CacheProvider::get<T> when the stored value is not a T.
class TypeMismatchException : public std::runtime_error {
public:
    TypeMismatchException(const std::string& key, const std::string& requested, const std::string& stored)
        : std::runtime_error("Type mismatch for key '" + key + "': requested " + requested + ", stored " + stored),
        key_(key), requested_(requested), stored_(stored) {}

    const std::string& key() const { return key_; }
    const std::string& requestedType() const { return requested_; }
    const std::string& storedType() const { return stored_; }

private:
    std::string key_;
    std::string requested_;
    std::string stored_;
};

#endif // CACHEEXCEPTIONS_HPP
