// encoder.cpp - implementation of msgpack_encoder_t and frame handling

#include "wirepack/encoder.hpp"

#include "wirepack/pack.hpp"
#include "wirepack/strip.hpp"

namespace wirepack {

// =============================================================================
// Frames
// =============================================================================

unexpected_text_input::unexpected_text_input()
    : std::runtime_error(
          "msgpack encoder received text data but expected binary. "
          "Ensure both ends of the link are configured with the msgpack encoder.")
{
}

auto is_text(const frame_t& frame) -> bool {
    return std::holds_alternative<std::string>(frame);
}

auto binary_view(const frame_t& frame) -> std::span<const std::uint8_t> {
    if (const auto* bytes = std::get_if<bytes_t>(&frame)) {
        return {bytes->data(), bytes->size()};
    }
    if (const auto* view = std::get_if<std::span<const std::uint8_t>>(&frame)) {
        return *view;
    }
    if (const auto* view = std::get_if<std::span<const std::byte>>(&frame)) {
        return {reinterpret_cast<const std::uint8_t*>(view->data()), view->size()};
    }
    if (const auto* slice = std::get_if<buffer_slice_t>(&frame)) {
        auto size = slice->backing ? slice->backing->size() : std::size_t{0};
        if (slice->offset > size || slice->length > size - slice->offset) {
            throw std::out_of_range(
                "buffer slice [" + std::to_string(slice->offset) + ", +" +
                std::to_string(slice->length) + ") exceeds backing buffer of " +
                std::to_string(size) + " bytes");
        }
        if (slice->length == 0) {
            return {};
        }
        return {slice->backing->data() + slice->offset, slice->length};
    }
    throw unexpected_text_input();
}

// =============================================================================
// msgpack_encoder_t
// =============================================================================

msgpack_encoder_t::msgpack_encoder_t(encoder_config_t config)
    : config_(config)
{
}

auto msgpack_encoder_t::encode(const value_t& data) const -> bytes_t {
    return pack(strip(data, config_.max_depth), config_.max_depth);
}

auto msgpack_encoder_t::decode(const frame_t& data) const -> value_t {
    if (is_text(data)) {
        throw unexpected_text_input();
    }
    return unpack(binary_view(data), config_);
}

auto encode(const value_t& data) -> bytes_t {
    return msgpack_encoder_t{}.encode(data);
}

auto decode(const frame_t& data) -> value_t {
    return msgpack_encoder_t{}.decode(data);
}

} // namespace wirepack
