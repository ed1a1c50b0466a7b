#pragma once
#include <salvage/decode/decoder.hpp>
#include <salvage/pipeline/partial_result.hpp>
#include <salvage/pipeline/safety.hpp>
#include <salvage/schema/primitives.hpp>
#include <cstddef>
#include <functional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace salvage::pipeline {

/// Decoding pipeline that builds a record from one raw value, one field at a
/// time.
///
/// `Ctor` is the record constructor, `Fields` are the constructor arguments
/// staged so far, in call order. Each step is decoded against the same raw
/// root value. `Safety` is `safe_tag` while every step has a fallback and
/// becomes `unsafe_tag` as soon as a step without one is chained.
///
/// Attempts are immutable values: chaining returns a new attempt and leaves
/// the receiver usable. Running an attempt has no side effects beyond those
/// of its decoders, so one attempt may be shared and run concurrently.
template <typename Ctor, typename Safety, typename... Fields>
class attempt final {
  static_assert(is_safety_tag_v<Safety>,
                "attempt safety must be safe_tag or unsafe_tag");

 public:
  using constructor_t = Ctor;
  using safety_t = Safety;
  using slots_t = std::tuple<Fields...>;
  using state_t = partial_result<slots_t>;
  using step_t = std::function<state_t(const salvage::schema::raw_value_t&)>;

  static constexpr std::size_t slot_count = sizeof...(Fields);

  attempt(Ctor constructor, step_t step)
      : constructor_(std::move(constructor)), step_(std::move(step)) {}

  /// Fill the next slot with `field_decoder`, substituting `fallback` and
  /// recording the error when it fails. Keeps the current safety.
  template <typename A>
  attempt<Ctor, join_t<Safety, safe_tag>, Fields..., A> try_or(
      salvage::decode::decoder<A> field_decoder,
      std::type_identity_t<A> fallback) const {
    using next_t = attempt<Ctor, join_t<Safety, safe_tag>, Fields..., A>;
    return next_t{
        constructor_,
        [prior = step_, field_decoder = std::move(field_decoder),
         fallback = std::move(fallback)](
            const salvage::schema::raw_value_t& raw) ->
        typename next_t::state_t {
          auto state = prior(raw);
          auto* current = std::get_if<partial_value<slots_t>>(&state);
          if (current == nullptr) {
            return std::get<critical_error>(std::move(state));
          }
          auto result = field_decoder(raw);
          if (const auto* error = salvage::decode::err_if(result)) {
            current->errors.push_back(*error);
            return append<A>(std::move(*current), fallback);
          }
          return append<A>(std::move(*current),
                           std::move(std::get<0>(result)));
        }};
  }

  /// Fill the next slot with `field_decoder`; a failure aborts the whole
  /// pipeline with that error. The result is always unsafe.
  template <typename A>
  attempt<Ctor, join_t<Safety, unsafe_tag>, Fields..., A> risk(
      salvage::decode::decoder<A> field_decoder) const {
    using next_t = attempt<Ctor, join_t<Safety, unsafe_tag>, Fields..., A>;
    return next_t{
        constructor_,
        [prior = step_, field_decoder = std::move(field_decoder)](
            const salvage::schema::raw_value_t& raw) ->
        typename next_t::state_t {
          auto state = prior(raw);
          auto* current = std::get_if<partial_value<slots_t>>(&state);
          if (current == nullptr) {
            return std::get<critical_error>(std::move(state));
          }
          auto result = field_decoder(raw);
          if (const auto* error = salvage::decode::err_if(result)) {
            // Minor errors gathered so far are dropped with the record.
            return critical_error{*error};
          }
          return append<A>(std::move(*current),
                           std::move(std::get<0>(result)));
        }};
  }

  /// Fill the next slot with a constant. Reads nothing from the raw value.
  template <typename A>
  attempt<Ctor, Safety, Fields..., A> hardcoded(A value) const {
    using next_t = attempt<Ctor, Safety, Fields..., A>;
    return next_t{
        constructor_,
        [prior = step_, value = std::move(value)](
            const salvage::schema::raw_value_t& raw) ->
        typename next_t::state_t {
          auto state = prior(raw);
          auto* current = std::get_if<partial_value<slots_t>>(&state);
          if (current == nullptr) {
            return std::get<critical_error>(std::move(state));
          }
          return append<A>(std::move(*current), value);
        }};
  }

  /// Apply every step to `raw` without constructing the record.
  state_t evaluate(const salvage::schema::raw_value_t& raw) const {
    return step_(raw);
  }

  const Ctor& constructor() const { return constructor_; }

 private:
  template <typename A>
  static partial_value<std::tuple<Fields..., A>> append(
      partial_value<slots_t>&& current,
      A value) {
    return partial_value<std::tuple<Fields..., A>>{
        .value = std::tuple_cat(std::move(current.value),
                                std::tuple<A>{std::move(value)}),
        .errors = std::move(current.errors)};
  }

  Ctor constructor_;
  step_t step_;
};

/// Start a pipeline for `constructor`. No field has been read yet and the
/// attempt is safe.
template <typename Ctor>
attempt<std::decay_t<Ctor>, safe_tag> from_value(Ctor&& constructor) {
  using attempt_t = attempt<std::decay_t<Ctor>, safe_tag>;
  return attempt_t{
      std::forward<Ctor>(constructor),
      [](const salvage::schema::raw_value_t&) ->
      typename attempt_t::state_t { return partial_value<std::tuple<>>{}; }};
}

/// Constructor that brace-initialises `Record` from the staged slots.
template <typename Record>
struct aggregate_constructor final {
  template <typename... Args>
  Record operator()(Args&&... args) const {
    return Record{std::forward<Args>(args)...};
  }
};

template <typename Record>
aggregate_constructor<Record> construct() {
  return aggregate_constructor<Record>{};
}

}  // namespace salvage::pipeline
