#include <salvage/decode/decode.hpp>
#include <salvage/records/user.hpp>

#include <string>

namespace salvage::records {

user_attempt_t make_user_attempt() {
  namespace decode = salvage::decode;
  return salvage::pipeline::from_value(salvage::pipeline::construct<user>())
      .risk(decode::field("id", decode::string()))
      .try_or(decode::field("profilePic", decode::string()),
              std::string{kDefaultProfilePic});
}

void to_json(salvage::schema::raw_value_t& out, const user& value) {
  out = salvage::schema::raw_value_t{{"id", value.id},
                                     {"profilePic", value.profile_pic}};
}

}  // namespace salvage::records
