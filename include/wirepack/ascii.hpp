#pragma once

// Human-readable rendering of a value tree.

#include <ostream>
#include <string>
#include "value.hpp"

namespace wirepack {

// =============================================================================
// ASCII format
// =============================================================================
//
//   {
//       id = 1
//       method = "query"
//       tags = ["admin", "user"]
//       params {
//           path = "user.getById"
//           input = absent
//       }
//       items [
//           {
//               ...
//           }
//       ]
//   }
//
// - Floats always carry a decimal point or exponent
// - Strings are quoted with \\ \" \n \t \r escaped
// - Blobs print as <bin N bytes>
// - Sequences of atoms print on one line
// - A composite already open on the current path prints as <cycle>
//
// =============================================================================

void write_ascii(std::ostream& os, const value_t& value, int indent = 4);

auto to_ascii(const value_t& value, int indent = 4) -> std::string;

auto operator<<(std::ostream& os, const value_t& value) -> std::ostream&;

} // namespace wirepack
