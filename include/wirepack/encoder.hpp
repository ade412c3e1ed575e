#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>

#include "config.hpp"
#include "value.hpp"

namespace wirepack {

// =============================================================================
// Inbound frames
// =============================================================================
//
// What a transport hands to decode(). Text frames arrive as std::string;
// every other alternative is binary.
//
// =============================================================================

// A window [offset, offset + length) into a larger shared buffer
struct buffer_slice_t {
    std::shared_ptr<const bytes_t> backing;
    std::size_t offset = 0;
    std::size_t length = 0;
};

using frame_t = std::variant<
    std::string,
    bytes_t,
    std::span<const std::uint8_t>,
    std::span<const std::byte>,
    buffer_slice_t
>;

auto is_text(const frame_t& frame) -> bool;

// Contiguous view of a binary frame's payload, without copying. Throws
// unexpected_text_input for a text frame and std::out_of_range for a
// slice that does not fit in its backing buffer.
auto binary_view(const frame_t& frame) -> std::span<const std::uint8_t>;

class unexpected_text_input : public std::runtime_error {
public:
    unexpected_text_input();
};

// =============================================================================
// encoder_t - pluggable encoder of a connection
// =============================================================================
//
// Both ends of a link must use the same encoder.
//
// =============================================================================

class encoder_t {
public:
    virtual ~encoder_t() = default;

    virtual auto encode(const value_t& data) const -> bytes_t = 0;
    virtual auto decode(const frame_t& data) const -> value_t = 0;
};

// =============================================================================
// msgpack_encoder_t
// =============================================================================
//
// encode: strip absent fields, then pack. MessagePack has no absent value
// (it would become nil), so stripping has to happen before packing.
//
// decode: reject text frames, normalize the binary payload, then unpack.
// Nothing is stripped on decode.
//
// =============================================================================

class msgpack_encoder_t : public encoder_t {
public:
    explicit msgpack_encoder_t(encoder_config_t config = {});

    auto encode(const value_t& data) const -> bytes_t override;
    auto decode(const frame_t& data) const -> value_t override;

    auto config() const -> const encoder_config_t& { return config_; }

private:
    encoder_config_t config_;
};

// Entry points using a default-configured msgpack_encoder_t
auto encode(const value_t& data) -> bytes_t;
auto decode(const frame_t& data) -> value_t;

} // namespace wirepack
