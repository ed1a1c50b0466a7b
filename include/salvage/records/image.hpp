#pragma once
#include <salvage/pipeline/attempt.hpp>
#include <salvage/pipeline/safety.hpp>
#include <salvage/schema/primitives.hpp>
#include <optional>
#include <string>

// Record: uploaded image.
// Every field has a fallback, so decoding an image never fails.
namespace salvage::records {

struct image final {
  std::string data_url;
  std::optional<salvage::schema::timestamp_milliseconds_t> created_at;

  bool operator==(const image&) const = default;
};

using image_attempt_t = salvage::pipeline::attempt<
    salvage::pipeline::aggregate_constructor<image>,
    salvage::pipeline::safe_tag,
    std::string,
    std::optional<salvage::schema::timestamp_milliseconds_t>>;

/// try_or(dataUrl, "") then try_or(createdAt, std::nullopt).
image_attempt_t make_image_attempt();

void to_json(salvage::schema::raw_value_t& out, const image& value);

}  // namespace salvage::records
