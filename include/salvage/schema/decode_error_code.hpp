#pragma once

#include <salvage/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: decode error code.
// Stable classification of field decoder failures, used for diagnostics and
// for matching errors in callers without parsing messages.
namespace salvage::schema {

enum class decode_error_code : uint8_t {
  missing_field = 0,
  type_mismatch = 1,
  out_of_range = 2,
  index_out_of_bounds = 3,
  no_alternative = 4,
  failure = 5,
};

inline constexpr auto kDecodeErrorCodeMappings = enum_mappings_t<decode_error_code, 6>{{
    {"missing_field", decode_error_code::missing_field},
    {"type_mismatch", decode_error_code::type_mismatch},
    {"out_of_range", decode_error_code::out_of_range},
    {"index_out_of_bounds", decode_error_code::index_out_of_bounds},
    {"no_alternative", decode_error_code::no_alternative},
    {"failure", decode_error_code::failure},
}};

template <>
inline std::optional<decode_error_code> try_from_string<decode_error_code>(
    const std::string_view value) {
  return from_string(value, kDecodeErrorCodeMappings);
}

inline constexpr std::string_view to_string(const decode_error_code value) {
  return to_string(value, kDecodeErrorCodeMappings).value_or("unknown");
}

}  // namespace salvage::schema
