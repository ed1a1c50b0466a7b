#pragma once
#include <salvage/common/critical.hpp>
#include <salvage/pipeline/attempt.hpp>
#include <salvage/pipeline/partial_result.hpp>
#include <salvage/pipeline/safety.hpp>
#include <salvage/schema/decode_error.hpp>
#include <salvage/schema/primitives.hpp>
#include <functional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace salvage::pipeline {

/// A constructed record plus every minor error met while building it.
template <typename T>
struct decoded final {
  T value;
  salvage::schema::decode_errors_t errors;
};

/// Either a record (with its minor errors) or the single critical error that
/// stopped the pipeline.
template <typename T>
using decode_outcome = std::variant<decoded<T>, salvage::schema::decode_error>;

template <typename Ctor, typename... Fields>
using record_t = std::decay_t<std::invoke_result_t<const Ctor&, Fields...>>;

namespace detail {

template <typename Ctor, typename... Fields>
decoded<record_t<Ctor, Fields...>> construct_record(
    const Ctor& constructor,
    partial_value<std::tuple<Fields...>>&& staged) {
  return decoded<record_t<Ctor, Fields...>>{
      .value = std::apply(constructor, std::move(staged.value)),
      .errors = std::move(staged.errors)};
}

template <typename T>
partial_value<T> expect_partial(partial_result<T>&& state) {
  if (auto* staged = std::get_if<partial_value<T>>(&state)) {
    return std::move(*staged);
  }
  const auto& failure = std::get<critical_error>(state).error;
  salvage::common::critical("safe attempt produced a critical decode error: " +
                            salvage::schema::to_string(failure));
}

}  // namespace detail

/// Run a safe attempt. Every step has a fallback, so this always yields a
/// record; unsafe attempts do not match this overload.
template <typename Ctor, typename... Fields>
auto run_safely(const attempt<Ctor, safe_tag, Fields...>& pipeline,
                const salvage::schema::raw_value_t& raw) {
  static_assert(std::is_invocable_v<const Ctor&, Fields...>,
                "attempt constructor cannot be called with the staged fields");
  return detail::construct_record(pipeline.constructor(),
                                  detail::expect_partial(pipeline.evaluate(raw)));
}

/// Run an attempt of either safety. A critical error is returned instead of
/// a record; minor errors accompany a successful record.
template <typename Ctor, typename Safety, typename... Fields>
auto run_dangerously(const attempt<Ctor, Safety, Fields...>& pipeline,
                     const salvage::schema::raw_value_t& raw) {
  static_assert(std::is_invocable_v<const Ctor&, Fields...>,
                "attempt constructor cannot be called with the staged fields");
  using outcome_t = decode_outcome<record_t<Ctor, Fields...>>;
  auto state = pipeline.evaluate(raw);
  if (auto* failure = std::get_if<critical_error>(&state)) {
    return outcome_t{std::in_place_index<1>, std::move(failure->error)};
  }
  return outcome_t{
      std::in_place_index<0>,
      detail::construct_record(
          pipeline.constructor(),
          std::move(std::get<partial_value<std::tuple<Fields...>>>(state)))};
}

}  // namespace salvage::pipeline
