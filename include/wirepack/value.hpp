#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace wirepack {

// =============================================================================
// Value tree
// =============================================================================
//
// A dynamically-typed value: null, absent, boolean, integer, float, text,
// binary blob, sequence or mapping. Atoms are held by value. Sequences and
// mappings are shared nodes: copying a value_t copies the reference, so two
// values may name the same node and a node may contain itself.
//
// Cyclic graphs keep their nodes alive; the owner must break the cycle
// (e.g. erase the back-reference) before dropping the last outside handle.
//
// =============================================================================

struct null_t {
    auto operator==(const null_t&) const -> bool = default;
};

// Marks a field that should not exist. Distinct from null.
struct absent_t {
    auto operator==(const absent_t&) const -> bool = default;
};

inline constexpr null_t null{};
inline constexpr absent_t absent{};

class value_t;
class mapping_t;

using bytes_t = std::vector<std::uint8_t>;
using sequence_t = std::vector<value_t>;
using sequence_ptr = std::shared_ptr<sequence_t>;
using mapping_ptr = std::shared_ptr<mapping_t>;

// Order matches the alternatives of value_t::storage_t
enum class kind_t {
    null,
    absent,
    boolean,
    int64,
    uint64,
    float64,
    string,
    binary,
    sequence,
    mapping,
};

auto kind_name(kind_t kind) -> const char*;

// =============================================================================
// value_t
// =============================================================================

class value_t {
public:
    using storage_t = std::variant<
        null_t,
        absent_t,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        bytes_t,
        sequence_ptr,
        mapping_ptr
    >;

    value_t() = default;
    value_t(null_t) {}
    value_t(absent_t) : storage_(absent_t{}) {}
    value_t(bool value) : storage_(value) {}
    value_t(double value) : storage_(value) {}
    value_t(const char* value) : storage_(std::string(value)) {}
    value_t(std::string value) : storage_(std::move(value)) {}
    value_t(std::string_view value) : storage_(std::string(value)) {}
    value_t(bytes_t value) : storage_(std::move(value)) {}
    value_t(sequence_ptr node) : storage_(std::move(node)) {}
    value_t(mapping_ptr node) : storage_(std::move(node)) {}

    // Unsigned values that fit are stored as int64, so an integer has
    // exactly one representation.
    template <typename T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
    value_t(T value) {
        if constexpr (std::is_signed_v<T>) {
            storage_ = static_cast<std::int64_t>(value);
        } else if (static_cast<std::uint64_t>(value) <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            storage_ = static_cast<std::int64_t>(value);
        } else {
            storage_ = static_cast<std::uint64_t>(value);
        }
    }

    auto kind() const -> kind_t { return static_cast<kind_t>(storage_.index()); }
    auto storage() const -> const storage_t& { return storage_; }

    auto is_null() const -> bool { return kind() == kind_t::null; }
    auto is_absent() const -> bool { return kind() == kind_t::absent; }
    auto is_bool() const -> bool { return kind() == kind_t::boolean; }
    auto is_integer() const -> bool { return kind() == kind_t::int64 || kind() == kind_t::uint64; }
    auto is_float() const -> bool { return kind() == kind_t::float64; }
    auto is_string() const -> bool { return kind() == kind_t::string; }
    auto is_binary() const -> bool { return kind() == kind_t::binary; }
    auto is_sequence() const -> bool { return kind() == kind_t::sequence; }
    auto is_mapping() const -> bool { return kind() == kind_t::mapping; }
    auto is_composite() const -> bool { return is_sequence() || is_mapping(); }

    // --- Typed access (throws std::runtime_error on a kind mismatch) ---

    auto as_bool() const -> bool;
    auto as_int64() const -> std::int64_t;
    auto as_uint64() const -> std::uint64_t;
    auto as_double() const -> double;
    auto as_string() const -> const std::string&;
    auto as_binary() const -> const bytes_t&;
    auto as_sequence() const -> const sequence_ptr&;
    auto as_mapping() const -> const mapping_ptr&;

    // Address of the composite node, nullptr for atoms
    auto identity() const -> const void*;

private:
    storage_t storage_;

    void expect(kind_t kind) const;
};

// Structural equality. Not defined for cyclic graphs.
auto operator==(const value_t& a, const value_t& b) -> bool;

// True when b is the very same node as a (composites), or an equal atom.
auto same_node(const value_t& a, const value_t& b) -> bool;

// =============================================================================
// mapping_t - insertion-ordered, unique text keys
// =============================================================================

class mapping_t {
public:
    using entry_t = std::pair<std::string, value_t>;
    using const_iterator = std::vector<entry_t>::const_iterator;

    mapping_t() = default;

    auto size() const -> std::size_t { return entries_.size(); }
    auto empty() const -> bool { return entries_.empty(); }
    auto begin() const -> const_iterator { return entries_.begin(); }
    auto end() const -> const_iterator { return entries_.end(); }
    auto entry(std::size_t index) const -> const entry_t& { return entries_[index]; }

    auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }
    auto find(std::string_view key) const -> const value_t*;
    auto find(std::string_view key) -> value_t*;
    auto at(std::string_view key) const -> const value_t&;

    // Replaces the value of an existing key in place, otherwise appends.
    void set(std::string key, value_t value);

    // Appends without a duplicate check; key must not already be present.
    void append(std::string key, value_t value);

    auto erase(std::string_view key) -> bool;
    void reserve(std::size_t n) { entries_.reserve(n); }

private:
    std::vector<entry_t> entries_;
};

// =============================================================================
// Factories
// =============================================================================

auto make_sequence(std::initializer_list<value_t> items = {}) -> value_t;
auto make_sequence(sequence_t items) -> value_t;
auto make_mapping(std::initializer_list<mapping_t::entry_t> entries = {}) -> value_t;

} // namespace wirepack
