#pragma once

#include <cstddef>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>

#include "convert.hpp"
#include "strip.hpp"

namespace wirepack {

// =============================================================================
// Encoder configuration
// =============================================================================

struct encoder_config_t {
    // Nesting bound for strip, pack and unpack
    std::size_t max_depth = default_max_depth;

    // Accept bytes after the first complete message on decode
    bool allow_trailing_bytes = false;
};

inline auto fields(const encoder_config_t& c) {
    return std::make_tuple(
        field("max_depth", c.max_depth),
        field("allow_trailing_bytes", c.allow_trailing_bytes)
    );
}

inline auto fields(encoder_config_t& c) {
    return std::make_tuple(
        field("max_depth", c.max_depth),
        field("allow_trailing_bytes", c.allow_trailing_bytes)
    );
}

// ============================================================================
// Config field setter by path
// ============================================================================

namespace detail {

// Parses value into target; failures name the full dotted path
template <typename T>
void parse_and_assign(const std::string& key, T& target, const std::string& value) {
    auto invalid = [&key, &value]() {
        return std::runtime_error("invalid value for " + key + ": '" + value + "'");
    };
    try {
        auto pos = std::size_t{0};
        if constexpr (std::is_same_v<T, bool>) {
            if (value == "true" || value == "1") {
                target = true;
            } else if (value == "false" || value == "0") {
                target = false;
            } else {
                throw invalid();
            }
            return;
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            if (value.empty() || value.front() == '-') throw invalid();
            auto v = std::stoull(value, &pos);
            if (v > std::numeric_limits<T>::max()) throw invalid();
            target = static_cast<T>(v);
        } else if constexpr (std::is_integral_v<T>) {
            auto v = std::stoll(value, &pos);
            if (v < std::numeric_limits<T>::min() || v > std::numeric_limits<T>::max()) throw invalid();
            target = static_cast<T>(v);
        } else if constexpr (std::is_floating_point_v<T>) {
            target = static_cast<T>(std::stod(value, &pos));
        } else if constexpr (std::is_same_v<T, std::string>) {
            target = value;
            return;
        } else if constexpr (HasEnumStrings<T>) {
            target = from_string(std::type_identity<T>{}, value);
            return;
        } else {
            throw std::runtime_error("unsupported type for set()");
        }
        if (pos != value.size()) {
            throw invalid();
        }
    } catch (const std::logic_error&) {
        // std::stoull and friends report bad input as invalid_argument/out_of_range
        throw invalid();
    }
}

template <typename T>
void assign_path(T& obj, std::string_view path, const std::string& value, const std::string& full_path);

template <typename M>
void assign_member(M& member, std::string_view key, std::string_view rest,
                   const std::string& value, const std::string& full_path) {
    if (rest.empty()) {
        parse_and_assign(full_path, member, value);
    } else if constexpr (HasFields<M>) {
        assign_path(member, rest, value, full_path);
    } else {
        throw std::runtime_error("cannot descend into '" + std::string(key) + "': not a struct");
    }
}

// Matches the first path segment against the field names of obj
template <typename T>
void assign_path(T& obj, std::string_view path, const std::string& value, const std::string& full_path) {
    auto dot = path.find('.');
    auto key = path.substr(0, dot);
    auto rest = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);

    auto matched = std::apply([&](auto&&... f) {
        return ((key == f.first && (assign_member(f.second, key, rest, value, full_path), true)) || ...);
    }, fields(obj));

    if (!matched) {
        throw std::runtime_error("field not found: " + full_path);
    }
}

} // namespace detail

/**
 * Set a field in a struct by dot-separated path.
 *
 * Example:
 *   set(config, "max_depth", "64");
 *   set(config, "allow_trailing_bytes", "true");
 */
template <HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    detail::assign_path(obj, path, value, path);
}

} // namespace wirepack
