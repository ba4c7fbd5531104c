#ifndef LOOKUPRESULT_HPP
#define LOOKUPRESULT_HPP

#include <optional>
#include <string>
#include <utility>

enum class LookupStatus {
    Found,
    NotFound,
    TypeMismatch
};

// Outcome of a typed lookup. value is engaged only when status == Found.
template <typename T>
struct LookupResult {
    LookupStatus status = LookupStatus::NotFound;
    std::optional<T> value;
    std::string stored_type; // Set on TypeMismatch

    static LookupResult found(T v) {
        LookupResult r;
        r.status = LookupStatus::Found;
        r.value = std::move(v);
        return r;
    }

    static LookupResult notFound() {
        return LookupResult{};
    }

    static LookupResult typeMismatch(std::string storedType) {
        LookupResult r;
        r.status = LookupStatus::TypeMismatch;
        r.stored_type = std::move(storedType);
        return r;
    }

    bool isFound() const { return status == LookupStatus::Found; }
};

#endif // LOOKUPRESULT_HPP
