#pragma once
#include <salvage/schema/decode_error.hpp>
#include <variant>

namespace salvage::pipeline {

/// Pipeline state while steps are still being applied: the slots decoded so
/// far (fallbacks included) and every minor error, in step order.
template <typename T>
struct partial_value final {
  T value;
  salvage::schema::decode_errors_t errors;
};

/// A step without a fallback failed. Later steps are skipped.
struct critical_error final {
  salvage::schema::decode_error error;
};

template <typename T>
using partial_result = std::variant<partial_value<T>, critical_error>;

}  // namespace salvage::pipeline
