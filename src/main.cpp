#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <salvage/common/critical.hpp>
#include <salvage/pipeline/run.hpp>
#include <salvage/records/image.hpp>
#include <salvage/records/record_kind.hpp>
#include <salvage/records/user.hpp>
#include <salvage/schema/decode_error.hpp>
#include <salvage/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace {

namespace po = boost::program_options;

using salvage::records::record_kind;
using salvage::schema::raw_value_t;

enum class run_mode : uint8_t { safe = 0, dangerous = 1 };

inline constexpr auto kRunModeMappings =
    salvage::schema::enum_mappings_t<run_mode, 2>{{
        {"safe", run_mode::safe},
        {"dangerous", run_mode::dangerous},
    }};

constexpr auto kExitClean = 0;
constexpr auto kExitMinorErrors = 1;
constexpr auto kExitCritical = 2;
constexpr auto kExitInvalidInput = 3;

std::optional<std::string> read_input(const std::string& path) {
  if (path.empty() || path == "-") {
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
  }
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{stream},
                     std::istreambuf_iterator<char>{}};
}

template <typename Record>
int report_decoded(const salvage::pipeline::decoded<Record>& result) {
  for (const auto& error : result.errors) {
    spdlog::warn("fallback used for {} [{}]",
                 salvage::schema::to_string(error),
                 salvage::schema::to_string(error.code));
  }
  std::cout << raw_value_t(result.value).dump(2) << '\n';
  return result.errors.empty() ? kExitClean : kExitMinorErrors;
}

template <typename Record>
int report_outcome(const salvage::pipeline::decode_outcome<Record>& outcome) {
  if (const auto* error =
          std::get_if<salvage::schema::decode_error>(&outcome)) {
    spdlog::error("decode failed at {} [{}]",
                  salvage::schema::to_string(*error),
                  salvage::schema::to_string(error->code));
    return kExitCritical;
  }
  return report_decoded(std::get<0>(outcome));
}

int decode_record(const record_kind kind,
                  const run_mode mode,
                  const raw_value_t& raw) {
  switch (kind) {
    case record_kind::user:
      if (mode == run_mode::safe) {
        spdlog::error(
            "record 'user' has fields without a fallback; use --mode "
            "dangerous");
        return kExitInvalidInput;
      }
      return report_outcome(salvage::pipeline::run_dangerously(
          salvage::records::make_user_attempt(), raw));
    case record_kind::image:
      if (mode == run_mode::safe) {
        return report_decoded(salvage::pipeline::run_safely(
            salvage::records::make_image_attempt(), raw));
      }
      return report_outcome(salvage::pipeline::run_dangerously(
          salvage::records::make_image_attempt(), raw));
  }
  salvage::common::critical("unhandled record kind");
}

}  // namespace

int main(int argc, char* argv[]) {
  auto logger = spdlog::stderr_color_mt("salvage");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto input = std::string{};
  auto record = std::string{};
  auto mode = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"salvage-decode"};
  description.add_options()("help,h", "Show the help message")(
      "input,i", po::value<std::string>(&input)->default_value("-"),
      "JSON document to decode, - for stdin")(
      "record,r", po::value<std::string>(&record)->default_value("user"),
      salvage::schema::joined_names(salvage::records::kRecordKindMappings)
          .c_str())(
      "mode,m", po::value<std::string>(&mode)->default_value("dangerous"),
      salvage::schema::joined_names(kRunModeMappings).c_str())(
      "verbose,v", "Enable debug logging")("quiet,q", "Only log errors");

  auto positional = po::positional_options_description{};
  positional.add("input", 1);
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    spdlog::error("invalid options: {}", ex.what());
    return kExitInvalidInput;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return kExitClean;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  } else if (vm.contains("quiet")) {
    spdlog::set_level(spdlog::level::err);
  }

  const auto kind =
      salvage::schema::try_from_string<record_kind>(record);
  if (!kind) {
    spdlog::error("unknown record '{}', expected {}", record,
                  salvage::schema::joined_names(
                      salvage::records::kRecordKindMappings));
    return kExitInvalidInput;
  }
  const auto run = salvage::schema::from_string(mode, kRunModeMappings);
  if (!run) {
    spdlog::error("unknown mode '{}', expected {}", mode,
                  salvage::schema::joined_names(kRunModeMappings));
    return kExitInvalidInput;
  }

  const auto text = read_input(input);
  if (!text) {
    spdlog::error("cannot read input '{}'", input);
    return kExitInvalidInput;
  }

  auto raw = raw_value_t{};
  try {
    raw = raw_value_t::parse(*text);
  } catch (const raw_value_t::parse_error& ex) {
    spdlog::error("input '{}' is not valid JSON: {}", input, ex.what());
    return kExitInvalidInput;
  }

  spdlog::debug("decoding {} from '{}' ({} bytes) in {} mode",
                salvage::records::to_string(*kind), input, text->size(), mode);
  const auto code = decode_record(*kind, *run, raw);
  spdlog::shutdown();
  return code;
}
