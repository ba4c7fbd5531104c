#ifndef VALUETRAITS_HPP
#define VALUETRAITS_HPP

#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

// Compile-time inspection of cached values: what counts as "null", what counts
// as "nothing worth caching", and which type a value is stored under.
namespace ValueTraits {

    template <typename T, typename = void>
    struct has_empty : std::false_type {};

    template <typename T>
    struct has_empty<T, std::void_t<decltype(std::declval<const T&>().empty())>> : std::true_type {};

    template <typename T, typename = void>
    struct has_is_null : std::false_type {};

    template <typename T>
    struct has_is_null<T, std::void_t<decltype(std::declval<const T&>().is_null())>> : std::true_type {};

    template <typename T>
    struct is_optional : std::false_type {};

    template <typename U>
    struct is_optional<std::optional<U>> : std::true_type {};

    template <typename T>
    struct is_shared_ptr : std::false_type {};

    template <typename U>
    struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

    template <typename T>
    constexpr bool is_c_string_v =
        std::is_same_v<std::decay_t<T>, const char*> || std::is_same_v<std::decay_t<T>, char*>;

    // C strings are stored as std::string so get<std::string>() finds them.
    template <typename T>
    using StoredType = std::conditional_t<is_c_string_v<T>, std::string, std::decay_t<T>>;

    template <typename T>
    bool isNull(const T& value) {
        if constexpr (std::is_null_pointer_v<T> || std::is_same_v<T, std::nullopt_t>) {
            return true;
        } else if constexpr (std::is_pointer_v<T>) {
            return value == nullptr;
        } else if constexpr (is_shared_ptr<T>::value) {
            return !value;
        } else if constexpr (is_optional<T>::value) {
            return !value.has_value();
        } else if constexpr (has_is_null<T>::value) {
            return value.is_null();
        } else {
            return false;
        }
    }

    // Expects a non-null value. Looks through pointers and optionals so an empty
    // vector behind a shared_ptr is still an empty collection.
    template <typename T>
    bool isEmptyCollection(const T& value) {
        if constexpr (is_c_string_v<T>) {
            return value[0] == '\0';
        } else if constexpr (std::is_pointer_v<T> || is_shared_ptr<T>::value || is_optional<T>::value) {
            return isEmptyCollection(*value);
        } else if constexpr (has_empty<T>::value) {
            return value.empty();
        } else {
            return false;
        }
    }

} // namespace ValueTraits

#endif // VALUETRAITS_HPP
