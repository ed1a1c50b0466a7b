#include <salvage/schema/primitives.hpp>

#include <cctype>
#include <string>

namespace salvage::schema {

namespace {

bool is_identifier(const std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const auto first = static_cast<unsigned char>(key.front());
  if (std::isalpha(first) == 0 && first != '_') {
    return false;
  }
  for (const auto ch : key) {
    const auto uc = static_cast<unsigned char>(ch);
    if (std::isalnum(uc) == 0 && uc != '_') {
      return false;
    }
  }
  return true;
}

void append_quoted(std::string& out, const std::string_view key) {
  out += "[\"";
  for (const auto ch : key) {
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out += "\"]";
}

}  // namespace

std::string to_string(const path_t& path) {
  auto out = std::string{"$"};
  for (const auto& segment : path) {
    std::visit(overloaded{[&](const field_name_t& key) {
                            if (is_identifier(key)) {
                              out.push_back('.');
                              out += key;
                            } else {
                              append_quoted(out, key);
                            }
                          },
                          [&](const array_index_t index) {
                            out.push_back('[');
                            out += std::to_string(index);
                            out.push_back(']');
                          }},
               segment);
  }
  return out;
}

std::string_view kind_name(const raw_value_t& value) {
  switch (value.type()) {
    case raw_value_t::value_t::null:
      return "null";
    case raw_value_t::value_t::object:
      return "object";
    case raw_value_t::value_t::array:
      return "array";
    case raw_value_t::value_t::string:
      return "string";
    case raw_value_t::value_t::boolean:
      return "boolean";
    case raw_value_t::value_t::number_integer:
    case raw_value_t::value_t::number_unsigned:
    case raw_value_t::value_t::number_float:
      return "number";
    case raw_value_t::value_t::binary:
      return "binary";
    case raw_value_t::value_t::discarded:
      return "discarded";
  }
  return "unknown";
}

}  // namespace salvage::schema
