#pragma once

// MessagePack serialization of the value tree (backed by msgpack-cxx).

#include <cstddef>
#include <cstdint>
#include <span>

#include "config.hpp"
#include "value.hpp"

namespace wirepack {

// =============================================================================
// Value tree <-> MessagePack mapping
// =============================================================================
//
//   value_t              MessagePack
//   -------------------  --------------------------------------------
//   null, absent         nil
//   boolean              true / false
//   int64, uint64        smallest int / uint form holding the value
//   float64              float 64 (float 32 is accepted on decode)
//   string               str
//   binary               bin
//   sequence             array
//   mapping              map with str keys, insertion order
//
// Decoding a positive integer yields int64 whenever it fits. A repeated map
// key keeps its first position and its last value.
//
// =============================================================================

// Throws depth_exceeded when a composite sits deeper than max_depth, which
// is also how a cyclic graph fails.
auto pack(const value_t& value, std::size_t max_depth = default_max_depth) -> bytes_t;

// Decodes exactly one message. Errors are msgpack-cxx's own exceptions:
// msgpack::insufficient_bytes, msgpack::parse_error (also for trailing
// bytes unless config.allow_trailing_bytes), msgpack::depth_size_overflow,
// and msgpack::type_error for non-str map keys and ext types.
auto unpack(std::span<const std::uint8_t> data, const encoder_config_t& config = {}) -> value_t;

} // namespace wirepack
