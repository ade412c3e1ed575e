#pragma once

// Conversion between typed C++ values and the value tree.
// Provides to_value/from_value free functions for common types.

#include <array>
#include <concepts>
#include <cstddef>
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "value.hpp"

namespace wirepack {

// ============================================================================
// Field helper - returns std::pair<const char*, T&>
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

// ============================================================================
// HasFields concept - requires ADL free function fields(t)
// ============================================================================

template <typename T>
concept HasFields = requires(T& t) {
    { fields(t) };
};

template <typename T>
concept HasConstFields = requires(const T& t) {
    { fields(t) };
};

// ============================================================================
// Enum string conversion via ADL
// ============================================================================

template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

// ============================================================================
// to_value declarations
// ============================================================================

inline auto to_value(const value_t& value) -> value_t;

template <typename T>
    requires std::is_arithmetic_v<T>
auto to_value(const T& value) -> value_t;

inline auto to_value(const std::string& value) -> value_t;

inline auto to_value(const bytes_t& value) -> value_t;

template <typename E>
    requires HasEnumStrings<E>
auto to_value(const E& value) -> value_t;

template <typename T>
auto to_value(const std::vector<T>& value) -> value_t;

template <typename T, std::size_t N>
auto to_value(const std::array<T, N>& value) -> value_t;

template <typename T>
auto to_value(const std::map<std::string, T>& value) -> value_t;

template <typename T>
auto to_value(const std::optional<T>& value) -> value_t;

template <typename T>
    requires HasConstFields<T>
auto to_value(const T& value) -> value_t;

// ============================================================================
// from_value declarations (two-arg: anonymous, three-arg: named)
// ============================================================================

// Named read from a mapping. Returns false, leaving the target untouched,
// when the key is missing or absent; an optional target is reset instead.
template <typename T>
auto from_value(const value_t& value, const char* name, T& out) -> bool;

inline auto from_value(const value_t& value, value_t& out) -> bool;

template <typename T>
    requires std::is_arithmetic_v<T>
auto from_value(const value_t& value, T& out) -> bool;

inline auto from_value(const value_t& value, std::string& out) -> bool;

inline auto from_value(const value_t& value, bytes_t& out) -> bool;

template <typename E>
    requires HasEnumStrings<E>
auto from_value(const value_t& value, E& out) -> bool;

template <typename T>
auto from_value(const value_t& value, std::vector<T>& out) -> bool;

template <typename T, std::size_t N>
auto from_value(const value_t& value, std::array<T, N>& out) -> bool;

template <typename T>
auto from_value(const value_t& value, std::map<std::string, T>& out) -> bool;

template <typename T>
auto from_value(const value_t& value, std::optional<T>& out) -> bool;

template <typename T>
    requires HasFields<T>
auto from_value(const value_t& value, T& out) -> bool;

// ============================================================================
// to_value implementations
// ============================================================================

inline auto to_value(const value_t& value) -> value_t {
    return value;
}

// Scalar types
template <typename T>
    requires std::is_arithmetic_v<T>
auto to_value(const T& value) -> value_t {
    if constexpr (std::is_floating_point_v<T>) {
        return static_cast<double>(value);
    } else {
        return value_t(value);
    }
}

inline auto to_value(const std::string& value) -> value_t {
    return value_t(value);
}

inline auto to_value(const bytes_t& value) -> value_t {
    return value_t(value);
}

// Enums with ADL to_string/from_string
template <typename E>
    requires HasEnumStrings<E>
auto to_value(const E& value) -> value_t {
    return value_t(std::string(to_string(value)));
}

template <typename T>
auto to_value(const std::vector<T>& value) -> value_t {
    auto items = sequence_t{};
    items.reserve(value.size());
    for (const auto& elem : value) {
        items.push_back(to_value(elem));
    }
    return make_sequence(std::move(items));
}

template <typename T, std::size_t N>
auto to_value(const std::array<T, N>& value) -> value_t {
    auto items = sequence_t{};
    items.reserve(N);
    for (const auto& elem : value) {
        items.push_back(to_value(elem));
    }
    return make_sequence(std::move(items));
}

template <typename T>
auto to_value(const std::map<std::string, T>& value) -> value_t {
    auto node = std::make_shared<mapping_t>();
    node->reserve(value.size());
    for (const auto& [key, val] : value) {
        node->append(key, to_value(val));
    }
    return node;
}

// An empty optional is an absent field, not null
template <typename T>
auto to_value(const std::optional<T>& value) -> value_t {
    if (!value.has_value()) {
        return absent;
    }
    return to_value(*value);
}

// Compound types with fields()
template <typename T>
    requires HasConstFields<T>
auto to_value(const T& value) -> value_t {
    auto node = std::make_shared<mapping_t>();
    std::apply([&node](auto&&... f) {
        (node->set(f.first, to_value(f.second)), ...);
    }, fields(value));
    return node;
}

// ============================================================================
// from_value implementations
// ============================================================================

template <typename T>
auto from_value(const value_t& value, const char* name, T& out) -> bool {
    const auto* item = value.as_mapping()->find(name);
    if (item == nullptr || item->is_absent()) {
        if constexpr (is_optional<T>::value) {
            out.reset();
        }
        return false;
    }
    return from_value(*item, out);
}

inline auto from_value(const value_t& value, value_t& out) -> bool {
    out = value;
    return true;
}

// Scalar types
template <typename T>
    requires std::is_arithmetic_v<T>
auto from_value(const value_t& value, T& out) -> bool {
    if constexpr (std::is_same_v<T, bool>) {
        out = value.as_bool();
    } else if constexpr (std::is_floating_point_v<T>) {
        if (value.is_integer()) {
            out = value.kind() == kind_t::int64
                ? static_cast<T>(value.as_int64())
                : static_cast<T>(value.as_uint64());
        } else {
            out = static_cast<T>(value.as_double());
        }
    } else if constexpr (std::is_signed_v<T>) {
        auto v = value.as_int64();
        if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) {
            throw std::runtime_error(
                "value out of range for " + std::to_string(sizeof(T) * 8) +
                "-bit signed integer: " + std::to_string(v));
        }
        out = static_cast<T>(v);
    } else {
        auto v = value.as_uint64();
        if (v > std::numeric_limits<T>::max()) {
            throw std::runtime_error(
                "value out of range for " + std::to_string(sizeof(T) * 8) +
                "-bit unsigned integer: " + std::to_string(v));
        }
        out = static_cast<T>(v);
    }
    return true;
}

inline auto from_value(const value_t& value, std::string& out) -> bool {
    out = value.as_string();
    return true;
}

inline auto from_value(const value_t& value, bytes_t& out) -> bool {
    out = value.as_binary();
    return true;
}

// Enums with ADL to_string/from_string
template <typename E>
    requires HasEnumStrings<E>
auto from_value(const value_t& value, E& out) -> bool {
    out = from_string(std::type_identity<E>{}, value.as_string());
    return true;
}

template <typename T>
auto from_value(const value_t& value, std::vector<T>& out) -> bool {
    const auto& items = *value.as_sequence();
    out.clear();
    out.reserve(items.size());
    for (const auto& item : items) {
        T elem{};
        from_value(item, elem);
        out.push_back(std::move(elem));
    }
    return true;
}

template <typename T, std::size_t N>
auto from_value(const value_t& value, std::array<T, N>& out) -> bool {
    const auto& items = *value.as_sequence();
    if (items.size() != N) {
        throw std::runtime_error(
            "array size mismatch: expected " + std::to_string(N) +
            ", got " + std::to_string(items.size()));
    }
    for (std::size_t i = 0; i < N; ++i) {
        from_value(items[i], out[i]);
    }
    return true;
}

template <typename T>
auto from_value(const value_t& value, std::map<std::string, T>& out) -> bool {
    out.clear();
    for (const auto& [key, item] : *value.as_mapping()) {
        if (item.is_absent()) continue;
        T val{};
        from_value(item, val);
        out[key] = std::move(val);
    }
    return true;
}

template <typename T>
auto from_value(const value_t& value, std::optional<T>& out) -> bool {
    if (value.is_null() || value.is_absent()) {
        out = std::nullopt;
        return true;
    }
    T temp{};
    from_value(value, temp);
    out = std::move(temp);
    return true;
}

// Compound types with fields(); missing keys keep their defaults
template <typename T>
    requires HasFields<T>
auto from_value(const value_t& value, T& out) -> bool {
    if (!value.is_mapping()) {
        throw std::runtime_error(std::string("expected mapping, got ") + kind_name(value.kind()));
    }
    std::apply([&value](auto&&... f) {
        (from_value(value, f.first, f.second), ...);
    }, fields(out));
    return true;
}

} // namespace wirepack
