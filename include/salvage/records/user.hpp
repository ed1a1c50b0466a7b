#pragma once
#include <salvage/pipeline/attempt.hpp>
#include <salvage/pipeline/safety.hpp>
#include <salvage/schema/primitives.hpp>
#include <string>
#include <string_view>

// Record: user profile.
// `id` is mission critical and has no fallback; a missing profile picture
// falls back to the default image.
namespace salvage::records {

inline constexpr auto kDefaultProfilePic = std::string_view{"default.png"};

struct user final {
  std::string id;
  std::string profile_pic;

  bool operator==(const user&) const = default;
};

using user_attempt_t =
    salvage::pipeline::attempt<salvage::pipeline::aggregate_constructor<user>,
                               salvage::pipeline::unsafe_tag,
                               std::string,
                               std::string>;

/// risk(id) then try_or(profilePic, "default.png").
user_attempt_t make_user_attempt();

void to_json(salvage::schema::raw_value_t& out, const user& value);

}  // namespace salvage::records
