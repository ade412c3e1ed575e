#pragma once

#include <cstddef>
#include <stdexcept>
#include "value.hpp"

namespace wirepack {

// =============================================================================
// Absent-field stripping
// =============================================================================
//
// strip() returns a copy of a value tree with every mapping entry whose
// value is absent removed. Sequence slots are never removed, so an absent
// sequence element survives.
//
// - Unchanged subtrees are returned as the very same nodes; a new node is
//   allocated only on the path to an omitted entry.
// - Each composite is stripped once per call. A node reached again through
//   another parent yields the same stripped node. A node reached again
//   through a cycle, while it is still being stripped, is returned as is,
//   so the back-reference points at the original.
// - The top-level value is at depth 0. Reaching a composite at a depth
//   greater than max_depth throws depth_exceeded; no partial result is
//   produced.
//
// The input is never modified and no state outlives the call.
//
// =============================================================================

inline constexpr std::size_t default_max_depth = 100;

class depth_exceeded : public std::runtime_error {
public:
    explicit depth_exceeded(std::size_t limit);

    auto limit() const -> std::size_t { return limit_; }

private:
    std::size_t limit_;
};

auto strip(const value_t& value) -> value_t;
auto strip(const value_t& value, std::size_t max_depth) -> value_t;

} // namespace wirepack
