// pack.cpp - MessagePack encoding and decoding of value_t via msgpack-cxx

#include "wirepack/pack.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <msgpack.hpp>

namespace wirepack {

namespace {

constexpr std::size_t no_limit = 0xffffffff;

auto checked_length(std::size_t length, const char* what) -> std::uint32_t {
    if (length > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error(std::string(what) + " exceeds the msgpack 4 GiB length limit");
    }
    return static_cast<std::uint32_t>(length);
}

// =============================================================================
// value_packer_t - walks a value tree into a msgpack::packer
// =============================================================================

class value_packer_t {
public:
    value_packer_t(msgpack::sbuffer& buffer, std::size_t max_depth)
        : pk_(buffer), max_depth_(max_depth) {}

    void pack(const value_t& value, std::size_t depth) {
        switch (value.kind()) {
            case kind_t::null:
            case kind_t::absent:
                pk_.pack_nil();
                break;
            case kind_t::boolean:
                if (value.as_bool()) {
                    pk_.pack_true();
                } else {
                    pk_.pack_false();
                }
                break;
            case kind_t::int64:
                pk_.pack_int64(value.as_int64());
                break;
            case kind_t::uint64:
                pk_.pack_uint64(value.as_uint64());
                break;
            case kind_t::float64:
                pk_.pack_double(value.as_double());
                break;
            case kind_t::string: {
                const auto& s = value.as_string();
                auto n = checked_length(s.size(), "string");
                pk_.pack_str(n);
                pk_.pack_str_body(s.data(), n);
                break;
            }
            case kind_t::binary: {
                const auto& b = value.as_binary();
                auto n = checked_length(b.size(), "binary");
                pk_.pack_bin(n);
                pk_.pack_bin_body(reinterpret_cast<const char*>(b.data()), n);
                break;
            }
            case kind_t::sequence:
                check_depth(depth);
                pack_sequence(*value.as_sequence(), depth);
                break;
            case kind_t::mapping:
                check_depth(depth);
                pack_mapping(*value.as_mapping(), depth);
                break;
        }
    }

private:
    msgpack::packer<msgpack::sbuffer> pk_;
    std::size_t max_depth_;

    void check_depth(std::size_t depth) const {
        if (depth > max_depth_) {
            throw depth_exceeded(max_depth_);
        }
    }

    void pack_sequence(const sequence_t& items, std::size_t depth) {
        pk_.pack_array(checked_length(items.size(), "array"));
        for (const auto& item : items) {
            pack(item, depth + 1);
        }
    }

    void pack_mapping(const mapping_t& entries, std::size_t depth) {
        pk_.pack_map(checked_length(entries.size(), "map"));
        for (const auto& [key, item] : entries) {
            auto n = checked_length(key.size(), "map key");
            pk_.pack_str(n);
            pk_.pack_str_body(key.data(), n);
            pack(item, depth + 1);
        }
    }
};

// =============================================================================
// Decoding
// =============================================================================

auto object_to_value(const msgpack::object& object) -> value_t {
    switch (object.type) {
        case msgpack::type::NIL:
            return null;
        case msgpack::type::BOOLEAN:
            return object.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return object.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return object.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return object.via.f64;
        case msgpack::type::STR:
            return std::string(object.via.str.ptr, object.via.str.size);
        case msgpack::type::BIN: {
            const auto* first = reinterpret_cast<const std::uint8_t*>(object.via.bin.ptr);
            return bytes_t(first, first + object.via.bin.size);
        }
        case msgpack::type::ARRAY: {
            auto items = std::make_shared<sequence_t>();
            items->reserve(object.via.array.size);
            for (std::uint32_t i = 0; i < object.via.array.size; ++i) {
                items->push_back(object_to_value(object.via.array.ptr[i]));
            }
            return items;
        }
        case msgpack::type::MAP: {
            // Keys view into the object zone, which outlives this call
            auto positions = std::unordered_map<std::string_view, std::size_t>{};
            auto entries = std::vector<mapping_t::entry_t>{};
            positions.reserve(object.via.map.size);
            entries.reserve(object.via.map.size);

            for (std::uint32_t i = 0; i < object.via.map.size; ++i) {
                const auto& kv = object.via.map.ptr[i];
                if (kv.key.type != msgpack::type::STR) {
                    throw msgpack::type_error();
                }
                auto key = std::string_view(kv.key.via.str.ptr, kv.key.via.str.size);
                auto [it, inserted] = positions.try_emplace(key, entries.size());
                if (inserted) {
                    entries.emplace_back(std::string(key), object_to_value(kv.val));
                } else {
                    entries[it->second].second = object_to_value(kv.val);
                }
            }

            auto node = std::make_shared<mapping_t>();
            node->reserve(entries.size());
            for (auto& [key, item] : entries) {
                node->append(std::move(key), std::move(item));
            }
            return node;
        }
        default:
            throw msgpack::type_error();
    }
}

} // namespace

auto pack(const value_t& value, std::size_t max_depth) -> bytes_t {
    auto buffer = msgpack::sbuffer{};
    auto packer = value_packer_t(buffer, max_depth);
    packer.pack(value, 0);

    const auto* first = reinterpret_cast<const std::uint8_t*>(buffer.data());
    return bytes_t(first, first + buffer.size());
}

auto unpack(std::span<const std::uint8_t> data, const encoder_config_t& config) -> value_t {
    // Depth counts nesting levels including the top-level container, so a
    // tree that strip() accepts (containers at depths 0..max_depth) fits.
    auto limit = msgpack::unpack_limit(
        no_limit, no_limit, no_limit, no_limit, no_limit, config.max_depth + 1);

    auto offset = std::size_t{0};
    auto handle = msgpack::unpack(
        reinterpret_cast<const char*>(data.data()), data.size(), offset,
        nullptr, nullptr, limit);

    if (offset != data.size() && !config.allow_trailing_bytes) {
        throw msgpack::parse_error(
            "extra " + std::to_string(data.size() - offset) + " of " +
            std::to_string(data.size()) + " byte(s) after message");
    }
    return object_to_value(handle.get());
}

} // namespace wirepack
