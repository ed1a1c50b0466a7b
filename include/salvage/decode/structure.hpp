#pragma once
#include <salvage/decode/decoder.hpp>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Structural decoders: walk into objects and arrays and keep the path of
// every nested failure relative to the value they were applied to.
namespace salvage::decode {

/// Decode the member `name` of an object with `inner`.
template <typename A>
decoder<A> field(const std::string_view name, decoder<A> inner) {
  return decoder<A>{[name = std::string{name}, inner = std::move(inner)](
                        const salvage::schema::raw_value_t& raw) {
    if (!raw.is_object()) {
      return make_err<A>(salvage::schema::make_type_mismatch("object", raw));
    }
    const auto it = raw.find(name);
    if (it == std::end(raw)) {
      return make_err<A>(salvage::schema::make_missing_field(name));
    }
    auto result = inner(*it);
    if (const auto* error = err_if(result)) {
      return make_err<A>(salvage::schema::prefixed(*error, name));
    }
    return result;
  }};
}

/// Decode a nested member, e.g. at({"user", "avatar", "url"}, string()).
template <typename A>
decoder<A> at(const std::vector<std::string>& names, decoder<A> inner) {
  auto out = std::move(inner);
  for (auto it = std::rbegin(names); it != std::rend(names); ++it) {
    out = field(*it, std::move(out));
  }
  return out;
}

/// Decode the element at `position` of an array with `inner`.
template <typename A>
decoder<A> index(const salvage::schema::array_index_t position,
                 decoder<A> inner) {
  return decoder<A>{[position, inner = std::move(inner)](
                        const salvage::schema::raw_value_t& raw) {
    if (!raw.is_array()) {
      return make_err<A>(salvage::schema::make_type_mismatch("array", raw));
    }
    if (position >= raw.size()) {
      return make_err<A>(
          salvage::schema::make_index_out_of_bounds(position, raw.size()));
    }
    auto result = inner(raw[position]);
    if (const auto* error = err_if(result)) {
      return make_err<A>(salvage::schema::prefixed(*error, position));
    }
    return result;
  }};
}

/// Decode every element of an array; the first failing element fails the
/// whole list.
template <typename A>
decoder<std::vector<A>> list(decoder<A> inner) {
  return decoder<std::vector<A>>{[inner = std::move(inner)](
                                     const salvage::schema::raw_value_t& raw) {
    if (!raw.is_array()) {
      return make_err<std::vector<A>>(
          salvage::schema::make_type_mismatch("array", raw));
    }
    auto out = std::vector<A>{};
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
      auto result = inner(raw[i]);
      if (const auto* error = err_if(result)) {
        return make_err<std::vector<A>>(salvage::schema::prefixed(
            *error, salvage::schema::array_index_t{i}));
      }
      out.push_back(std::move(std::get<0>(result)));
    }
    return make_ok(std::move(out));
  }};
}

}  // namespace salvage::decode
