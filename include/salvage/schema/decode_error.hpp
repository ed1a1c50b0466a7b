#pragma once
#include <salvage/schema/decode_error_code.hpp>
#include <salvage/schema/primitives.hpp>
#include <string>
#include <string_view>
#include <vector>

// Schema type: decode error.
// A single field decoder failure: where in the document it happened and why.
namespace salvage::schema {

struct decode_error final {
  path_t path;
  std::string message;
  decode_error_code code{decode_error_code::failure};

  bool operator==(const decode_error&) const = default;
};

using decode_errors_t = std::vector<decode_error>;

/// `key` was required but absent from the object at the current path.
decode_error make_missing_field(std::string_view key);

/// The value at the current path has the wrong JSON kind.
decode_error make_type_mismatch(std::string_view expected,
                                const raw_value_t& found);

/// A numeric value does not fit the requested representation.
decode_error make_out_of_range(std::string_view target,
                               const raw_value_t& found);

decode_error make_index_out_of_bounds(array_index_t index, std::size_t size);

decode_error make_failure(std::string message);

/// Return `error` relocated one level deeper, under `segment`.
decode_error prefixed(decode_error error, path_segment_t segment);

/// Render as `<path>: <message>`.
std::string to_string(const decode_error& error);

}  // namespace salvage::schema
