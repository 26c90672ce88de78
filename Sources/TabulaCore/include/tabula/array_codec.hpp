#pragma once

#include "schema.hpp"
#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace tabula {

// ============================================================================
// Aggregate array columns
//
// An array field is stored twice: as a JSON array in the aggregate column and
// as N positional expansion columns Name_0 .. Name_(N-1). N is fixed at build
// time (column::array_size) and never re-derived from the data.
// ============================================================================

// JSON array of the non-zero values, in order.
// Timestamps are RFC 3339 strings, blobs lower-case hex.
std::string encode_array(const std::vector<scalar_value>& values);

// Inverse of encode_array for elements of the given kind.
// Throws parse_error when the text is not a JSON array of matching elements.
std::vector<scalar_value> decode_array(const std::string& json_text, column_kind base);

// Places values into exactly `slots` positions; unused slots hold the zero value.
// Values beyond `slots` are dropped.
std::vector<scalar_value> expand_array(const std::vector<scalar_value>& values,
                                       size_t slots, column_kind base);

// Reads slots in order and stops at the first zero value.
std::vector<scalar_value> collect_array(const std::vector<scalar_value>& slots);

// Storage value back to a typed scalar of the given kind. NULL maps to the zero value.
scalar_value from_column_value(const column_value_t& v, column_kind kind);

// Rebuilds an array field from a fetched row using the aggregate's stored N.
// Stops at the first missing, NULL or zero slot.
std::vector<scalar_value> reconstruct_array(const std::unordered_map<std::string, column_value_t>& row,
                                            const column& aggregate);

} // namespace tabula
