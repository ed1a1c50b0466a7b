#pragma once
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace salvage::schema {

// Already parsed, untyped document that decoders operate on.
using raw_value_t = nlohmann::json;

using field_name_t = std::string;
using array_index_t = std::size_t;
using path_segment_t = std::variant<field_name_t, array_index_t>;

/// Ordered keys from the decode root down to the failing value.
using path_t = std::vector<path_segment_t>;

using timestamp_milliseconds_t = int64_t;

/// Render a path as `$`, `$.a.b` or `$.items[2].name`.
std::string to_string(const path_t& path);

/// Human name of the JSON kind held by `value` ("string", "object", ...).
std::string_view kind_name(const raw_value_t& value);

}  // namespace salvage::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
