#pragma once

#include <salvage/decode/decoder.hpp>
#include <salvage/schema/decode_error.hpp>
#include <salvage/schema/primitives.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace salvage::testing {

inline salvage::schema::raw_value_t parse(const std::string_view text) {
  return salvage::schema::raw_value_t::parse(text);
}

/// Names of instrumented decoders, in the order they were invoked.
using call_log_t = std::shared_ptr<std::vector<std::string>>;

inline call_log_t make_call_log() {
  return std::make_shared<std::vector<std::string>>();
}

/// Wrap `inner` so every invocation is recorded in `log` under `name`.
template <typename A>
salvage::decode::decoder<A> instrumented(std::string name,
                                         salvage::decode::decoder<A> inner,
                                         call_log_t log) {
  return salvage::decode::decoder<A>{
      [name = std::move(name), inner = std::move(inner),
       log = std::move(log)](const salvage::schema::raw_value_t& raw) {
        log->push_back(name);
        return inner(raw);
      }};
}

/// Decoder double that always fails with `message`.
template <typename A>
salvage::decode::decoder<A> failing(std::string message) {
  return salvage::decode::decoder<A>{
      [message = std::move(message)](const salvage::schema::raw_value_t&) {
        return salvage::decode::make_err<A>(
            salvage::schema::make_failure(message));
      }};
}

inline salvage::schema::decode_error missing_field(const std::string_view key) {
  return salvage::schema::make_missing_field(key);
}

inline std::size_t count(const call_log_t& log, const std::string_view name) {
  auto total = std::size_t{0};
  for (const auto& entry : *log) {
    if (entry == name) {
      ++total;
    }
  }
  return total;
}

}  // namespace salvage::testing
