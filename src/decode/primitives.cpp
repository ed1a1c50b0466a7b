#include <salvage/decode/decoder.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace salvage::schema;

namespace salvage::decode {

decoder<std::string> string() {
  return decoder<std::string>{[](const raw_value_t& raw) {
    if (!raw.is_string()) {
      return make_err<std::string>(make_type_mismatch("string", raw));
    }
    return make_ok(raw.get<std::string>());
  }};
}

decoder<int64_t> integer() {
  return decoder<int64_t>{[](const raw_value_t& raw) {
    if (raw.is_number_unsigned()) {
      const auto value = raw.get<uint64_t>();
      if (value >
          static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return make_err<int64_t>(make_out_of_range("int64", raw));
      }
      return make_ok(static_cast<int64_t>(value));
    }
    if (raw.is_number_integer()) {
      return make_ok(raw.get<int64_t>());
    }
    if (raw.is_number_float()) {
      return make_err<int64_t>(
          decode_error{.path = {},
                       .message = "expected integer, found fractional number " +
                                  raw.dump(),
                       .code = decode_error_code::type_mismatch});
    }
    return make_err<int64_t>(make_type_mismatch("integer", raw));
  }};
}

decoder<uint64_t> unsigned_integer() {
  return decoder<uint64_t>{[](const raw_value_t& raw) {
    if (raw.is_number_unsigned()) {
      return make_ok(raw.get<uint64_t>());
    }
    if (raw.is_number_integer()) {
      return make_err<uint64_t>(make_out_of_range("uint64", raw));
    }
    return make_err<uint64_t>(make_type_mismatch("unsigned integer", raw));
  }};
}

decoder<double> number() {
  return decoder<double>{[](const raw_value_t& raw) {
    if (!raw.is_number()) {
      return make_err<double>(make_type_mismatch("number", raw));
    }
    return make_ok(raw.get<double>());
  }};
}

decoder<bool> boolean() {
  return decoder<bool>{[](const raw_value_t& raw) {
    if (!raw.is_boolean()) {
      return make_err<bool>(make_type_mismatch("boolean", raw));
    }
    return make_ok(raw.get<bool>());
  }};
}

}  // namespace salvage::decode
