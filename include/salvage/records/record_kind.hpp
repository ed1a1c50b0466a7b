#pragma once

#include <salvage/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: record kind.
// Records with a bundled decoding pipeline, selectable by name.
namespace salvage::records {

enum class record_kind : uint8_t { user = 0, image = 1 };

inline constexpr auto kRecordKindMappings =
    salvage::schema::enum_mappings_t<record_kind, 2>{{
        {"user", record_kind::user},
        {"image", record_kind::image},
    }};

inline constexpr std::string_view to_string(const record_kind value) {
  return salvage::schema::to_string(value, kRecordKindMappings)
      .value_or("unknown");
}

}  // namespace salvage::records

namespace salvage::schema {

template <>
inline std::optional<salvage::records::record_kind>
try_from_string<salvage::records::record_kind>(const std::string_view value) {
  return from_string(value, salvage::records::kRecordKindMappings);
}

}  // namespace salvage::schema
