#pragma once
#include <salvage/decode/decoder.hpp>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace salvage::decode {

/// Ignore the input and produce `value`.
template <typename A>
decoder<A> succeed(A value) {
  return decoder<A>{
      [value = std::move(value)](const salvage::schema::raw_value_t&) {
        return make_ok(value);
      }};
}

/// Ignore the input and fail with `message`.
template <typename A>
decoder<A> fail(const std::string_view message) {
  return decoder<A>{[message = std::string{message}](
                        const salvage::schema::raw_value_t&) {
    return make_err<A>(salvage::schema::make_failure(message));
  }};
}

/// Accept only `null`, producing `value`.
template <typename A>
decoder<A> null(A value) {
  return decoder<A>{
      [value = std::move(value)](const salvage::schema::raw_value_t& raw) {
        if (!raw.is_null()) {
          return make_err<A>(salvage::schema::make_type_mismatch("null", raw));
        }
        return make_ok(value);
      }};
}

/// Transform a successful result with `fn`.
template <typename A, typename Fn>
auto map(decoder<A> inner, Fn fn) {
  using B = std::decay_t<std::invoke_result_t<const Fn&, A>>;
  return decoder<B>{[inner = std::move(inner), fn = std::move(fn)](
                        const salvage::schema::raw_value_t& raw) {
    auto result = inner(raw);
    if (const auto* error = err_if(result)) {
      return make_err<B>(*error);
    }
    return make_ok<B>(std::invoke(fn, std::move(std::get<0>(result))));
  }};
}

/// Choose the next decoder from a successful result; both run against the
/// same raw value.
template <typename A, typename Fn>
auto and_then(decoder<A> inner, Fn fn) {
  using next_t = std::decay_t<std::invoke_result_t<const Fn&, A>>;
  static_assert(is_decoder_v<next_t>, "and_then callback must return a decoder");
  using B = typename next_t::value_type;
  return decoder<B>{[inner = std::move(inner), fn = std::move(fn)](
                        const salvage::schema::raw_value_t& raw) {
    auto result = inner(raw);
    if (const auto* error = err_if(result)) {
      return make_err<B>(*error);
    }
    const auto next = std::invoke(fn, std::move(std::get<0>(result)));
    return next(raw);
  }};
}

/// First alternative that succeeds. When every alternative fails the error
/// lists each failure in order.
template <typename A>
decoder<A> one_of(std::vector<decoder<A>> alternatives) {
  return decoder<A>{[alternatives = std::move(alternatives)](
                        const salvage::schema::raw_value_t& raw) {
    auto message = std::string{"no alternative matched"};
    auto separator = std::string_view{": "};
    for (const auto& alternative : alternatives) {
      auto result = alternative(raw);
      const auto* error = err_if(result);
      if (error == nullptr) {
        return result;
      }
      message += separator;
      message += salvage::schema::to_string(*error);
      separator = "; ";
    }
    return make_err<A>(salvage::schema::decode_error{
        .path = {},
        .message = std::move(message),
        .code = salvage::schema::decode_error_code::no_alternative});
  }};
}

/// `null` decodes to std::nullopt, anything else goes through `inner`.
template <typename A>
decoder<std::optional<A>> nullable(decoder<A> inner) {
  using B = std::optional<A>;
  return decoder<B>{[inner = std::move(inner)](
                        const salvage::schema::raw_value_t& raw) {
    if (raw.is_null()) {
      return make_ok<B>(std::nullopt);
    }
    auto result = inner(raw);
    if (const auto* error = err_if(result)) {
      return make_err<B>(*error);
    }
    return make_ok<B>(std::move(std::get<0>(result)));
  }};
}

/// Like `field`, but a missing or null member decodes to std::nullopt. A
/// member that is present and malformed is still an error.
template <typename A>
decoder<std::optional<A>> optional_field(const std::string_view name,
                                         decoder<A> inner) {
  using B = std::optional<A>;
  return decoder<B>{[name = std::string{name}, inner = std::move(inner)](
                        const salvage::schema::raw_value_t& raw) {
    if (!raw.is_object()) {
      return make_err<B>(salvage::schema::make_type_mismatch("object", raw));
    }
    const auto it = raw.find(name);
    if (it == std::end(raw) || it->is_null()) {
      return make_ok<B>(std::nullopt);
    }
    auto result = inner(*it);
    if (const auto* error = err_if(result)) {
      return make_err<B>(salvage::schema::prefixed(*error, name));
    }
    return make_ok<B>(std::move(std::get<0>(result)));
  }};
}

}  // namespace salvage::decode
