#include <salvage/decode/decode.hpp>
#include <salvage/records/image.hpp>

#include <optional>
#include <string>

namespace salvage::records {

image_attempt_t make_image_attempt() {
  namespace decode = salvage::decode;
  return salvage::pipeline::from_value(salvage::pipeline::construct<image>())
      .try_or(decode::field("dataUrl", decode::string()), std::string{})
      .try_or(decode::field("createdAt", decode::nullable(decode::integer())),
              std::nullopt);
}

void to_json(salvage::schema::raw_value_t& out, const image& value) {
  out = salvage::schema::raw_value_t{{"dataUrl", value.data_url}};
  if (value.created_at.has_value()) {
    out["createdAt"] = *value.created_at;
  } else {
    out["createdAt"] = nullptr;
  }
}

}  // namespace salvage::records
