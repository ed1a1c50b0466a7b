#pragma once
#include <type_traits>

// Static safety marker carried by every attempt.
//
// The markers form a two-point lattice, safe below unsafe. A pipeline only
// moves up: once a step without a fallback is chained the attempt is unsafe
// for good, and only the fallible entry point accepts it.
namespace salvage::pipeline {

/// Every step has a fallback; running the attempt cannot fail.
struct safe_tag {};

/// At least one step has no fallback; running the attempt can fail.
struct unsafe_tag {};

template <typename Lhs, typename Rhs>
struct join {
  using type = unsafe_tag;
};

template <>
struct join<safe_tag, safe_tag> {
  using type = safe_tag;
};

/// Least upper bound of two markers.
template <typename Lhs, typename Rhs>
using join_t = typename join<Lhs, Rhs>::type;

template <typename Safety>
inline constexpr bool is_safety_tag_v =
    std::is_same_v<Safety, safe_tag> || std::is_same_v<Safety, unsafe_tag>;

template <typename Safety>
inline constexpr bool is_safe_v = std::is_same_v<Safety, safe_tag>;

}  // namespace salvage::pipeline
