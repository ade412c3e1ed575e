// value.cpp - implementation of value_t and mapping_t

#include "wirepack/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace wirepack {

auto kind_name(kind_t kind) -> const char* {
    switch (kind) {
        case kind_t::null:     return "null";
        case kind_t::absent:   return "absent";
        case kind_t::boolean:  return "boolean";
        case kind_t::int64:    return "int64";
        case kind_t::uint64:   return "uint64";
        case kind_t::float64:  return "float64";
        case kind_t::string:   return "string";
        case kind_t::binary:   return "binary";
        case kind_t::sequence: return "sequence";
        case kind_t::mapping:  return "mapping";
    }
    return "unknown";
}

// =============================================================================
// value_t accessors
// =============================================================================

void value_t::expect(kind_t kind) const {
    if (this->kind() != kind) {
        throw std::runtime_error(
            std::string("expected ") + kind_name(kind) + ", got " + kind_name(this->kind()));
    }
}

auto value_t::as_bool() const -> bool {
    expect(kind_t::boolean);
    return std::get<bool>(storage_);
}

auto value_t::as_int64() const -> std::int64_t {
    expect(kind_t::int64);
    return std::get<std::int64_t>(storage_);
}

auto value_t::as_uint64() const -> std::uint64_t {
    if (kind() == kind_t::int64) {
        auto v = std::get<std::int64_t>(storage_);
        if (v < 0) {
            throw std::runtime_error("expected uint64, got negative int64");
        }
        return static_cast<std::uint64_t>(v);
    }
    expect(kind_t::uint64);
    return std::get<std::uint64_t>(storage_);
}

auto value_t::as_double() const -> double {
    expect(kind_t::float64);
    return std::get<double>(storage_);
}

auto value_t::as_string() const -> const std::string& {
    expect(kind_t::string);
    return std::get<std::string>(storage_);
}

auto value_t::as_binary() const -> const bytes_t& {
    expect(kind_t::binary);
    return std::get<bytes_t>(storage_);
}

auto value_t::as_sequence() const -> const sequence_ptr& {
    expect(kind_t::sequence);
    return std::get<sequence_ptr>(storage_);
}

auto value_t::as_mapping() const -> const mapping_ptr& {
    expect(kind_t::mapping);
    return std::get<mapping_ptr>(storage_);
}

auto value_t::identity() const -> const void* {
    if (is_sequence()) return std::get<sequence_ptr>(storage_).get();
    if (is_mapping()) return std::get<mapping_ptr>(storage_).get();
    return nullptr;
}

// =============================================================================
// Comparison
// =============================================================================

auto operator==(const value_t& a, const value_t& b) -> bool {
    if (a.kind() != b.kind()) {
        return false;
    }
    if (a.is_sequence()) {
        const auto& x = *a.as_sequence();
        const auto& y = *b.as_sequence();
        return &x == &y || std::equal(x.begin(), x.end(), y.begin(), y.end());
    }
    if (a.is_mapping()) {
        const auto& x = *a.as_mapping();
        const auto& y = *b.as_mapping();
        if (&x == &y) return true;
        if (x.size() != y.size()) return false;
        for (const auto& [key, item] : x) {
            const auto* other = y.find(key);
            if (other == nullptr || !(item == *other)) return false;
        }
        return true;
    }
    return a.storage() == b.storage();
}

auto same_node(const value_t& a, const value_t& b) -> bool {
    if (a.is_composite() || b.is_composite()) {
        return a.kind() == b.kind() && a.identity() == b.identity();
    }
    return a.storage() == b.storage();
}

// =============================================================================
// mapping_t
// =============================================================================

auto mapping_t::find(std::string_view key) const -> const value_t* {
    for (const auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

auto mapping_t::find(std::string_view key) -> value_t* {
    for (auto& entry : entries_) {
        if (entry.first == key) return &entry.second;
    }
    return nullptr;
}

auto mapping_t::at(std::string_view key) const -> const value_t& {
    const auto* item = find(key);
    if (item == nullptr) {
        throw std::runtime_error("key not found: " + std::string(key));
    }
    return *item;
}

void mapping_t::set(std::string key, value_t value) {
    if (auto* item = find(key)) {
        *item = std::move(value);
    } else {
        entries_.emplace_back(std::move(key), std::move(value));
    }
}

void mapping_t::append(std::string key, value_t value) {
    entries_.emplace_back(std::move(key), std::move(value));
}

auto mapping_t::erase(std::string_view key) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(), [key](const entry_t& entry) {
        return entry.first == key;
    });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

// =============================================================================
// Factories
// =============================================================================

auto make_sequence(std::initializer_list<value_t> items) -> value_t {
    return std::make_shared<sequence_t>(items);
}

auto make_sequence(sequence_t items) -> value_t {
    return std::make_shared<sequence_t>(std::move(items));
}

auto make_mapping(std::initializer_list<mapping_t::entry_t> entries) -> value_t {
    auto node = std::make_shared<mapping_t>();
    node->reserve(entries.size());
    for (const auto& [key, item] : entries) {
        node->set(key, item);
    }
    return node;
}

} // namespace wirepack
