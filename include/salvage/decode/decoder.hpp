#pragma once
#include <salvage/schema/decode_error.hpp>
#include <salvage/schema/primitives.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace salvage::decode {

/// Either the decoded value (index 0) or the reason it could not be decoded.
template <typename A>
using decode_result = std::variant<A, salvage::schema::decode_error>;

template <typename A>
decode_result<A> make_ok(A value) {
  return decode_result<A>{std::in_place_index<0>, std::move(value)};
}

template <typename A>
decode_result<A> make_err(salvage::schema::decode_error error) {
  return decode_result<A>{std::in_place_index<1>, std::move(error)};
}

template <typename A>
const A* ok_if(const decode_result<A>& result) {
  return std::get_if<0>(&result);
}

template <typename A>
const salvage::schema::decode_error* err_if(const decode_result<A>& result) {
  return std::get_if<1>(&result);
}

/// Extracts and converts one value from a raw document.
///
/// A decoder is an immutable value: copying it shares nothing mutable, and
/// invoking it has no side effects beyond those of the wrapped function.
/// Failures carry a path relative to the value the decoder was applied to;
/// structural decoders (`field`, `index`, `list`) prefix their own segment.
template <typename A>
class decoder final {
 public:
  using value_type = A;
  using function_t =
      std::function<decode_result<A>(const salvage::schema::raw_value_t&)>;

  explicit decoder(function_t function) : function_(std::move(function)) {}

  decode_result<A> operator()(const salvage::schema::raw_value_t& raw) const {
    return function_(raw);
  }

 private:
  function_t function_;
};

template <typename T>
struct is_decoder : std::false_type {};

template <typename A>
struct is_decoder<decoder<A>> : std::true_type {};

template <typename T>
inline constexpr bool is_decoder_v = is_decoder<std::decay_t<T>>::value;

/// JSON string.
decoder<std::string> string();

/// JSON integer representable as int64_t. Fractional numbers are rejected.
decoder<int64_t> integer();

/// JSON integer representable as uint64_t.
decoder<uint64_t> unsigned_integer();

/// Any JSON number, widened to double.
decoder<double> number();

decoder<bool> boolean();

}  // namespace salvage::decode
