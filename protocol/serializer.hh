#pragma once

#include "protocol/value.hh"

namespace kvchain::protocol {

// Keep-binary codec. Numbers are stored as 8 little-endian bytes, booleans as
// a single byte, strings verbatim and null as an empty payload. A binary object
// is passed through unchanged in both directions.

binary_object to_binary(const value& v);

// throws util::serialization_error if the payload does not match its kind
value from_binary(const binary_object& b);

value to_binary_value(const value& v);

value from_binary_value(const value& v);

entry_map to_binary(const entry_map& m);

entry_map from_binary(const entry_map& m);

}  // namespace kvchain::protocol
