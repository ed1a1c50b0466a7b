#include <salvage/schema/decode_error.hpp>

#include <iterator>
#include <utility>

namespace salvage::schema {

decode_error make_missing_field(const std::string_view key) {
  auto message = std::string{"missing field \""};
  message += key;
  message += "\"";
  return decode_error{.path = path_t{field_name_t{key}},
                      .message = std::move(message),
                      .code = decode_error_code::missing_field};
}

decode_error make_type_mismatch(const std::string_view expected,
                                const raw_value_t& found) {
  auto message = std::string{"expected "};
  message += expected;
  message += ", found ";
  message += kind_name(found);
  return decode_error{.path = {},
                      .message = std::move(message),
                      .code = decode_error_code::type_mismatch};
}

decode_error make_out_of_range(const std::string_view target,
                               const raw_value_t& found) {
  auto message = std::string{"number "};
  message += found.dump();
  message += " does not fit ";
  message += target;
  return decode_error{.path = {},
                      .message = std::move(message),
                      .code = decode_error_code::out_of_range};
}

decode_error make_index_out_of_bounds(const array_index_t index,
                                      const std::size_t size) {
  return decode_error{
      .path = {},
      .message = "index " + std::to_string(index) +
                 " out of bounds for array of size " + std::to_string(size),
      .code = decode_error_code::index_out_of_bounds};
}

decode_error make_failure(std::string message) {
  return decode_error{.path = {},
                      .message = std::move(message),
                      .code = decode_error_code::failure};
}

decode_error prefixed(decode_error error, path_segment_t segment) {
  error.path.insert(std::begin(error.path), std::move(segment));
  return error;
}

std::string to_string(const decode_error& error) {
  return to_string(error.path) + ": " + error.message;
}

}  // namespace salvage::schema
