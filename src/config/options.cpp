#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <credence/config/options.hpp>
#include <fstream>
#include <limits>

using namespace credence::schema;
namespace po = boost::program_options;

namespace {

constexpr auto kCodespace = "credence.config";

}  // namespace

namespace credence::config {

po::options_description make_general_options() {
  auto options = po::options_description{"General options"};
  options.add_options()("config,c", po::value<std::string>(),
                        "INI-style configuration file")(
      "db-path", po::value<std::string>()->default_value(
                     std::string{kDefaultDatabasePath}),
      "RocksDB directory of the registry")(
      "authority-id",
      po::value<std::string>()->default_value(
          std::string{credence::registry::kDefaultAuthorityId}),
      "organization id of the attestation authority")(
      "minimum-stake",
      po::value<std::string>()->default_value(
          std::to_string(credence::registry::kDefaultMinimumStake)),
      "minimum stake required to register an organization")(
      "confidence-policy",
      po::value<std::string>()->default_value("simple-average"),
      "simple-average|weighted-blend")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(), "also write logs to this file");
  return options;
}

void load_config_file(po::variables_map& vm,
                      const po::options_description& description) {
  if (!vm.contains("config")) {
    return;
  }
  const auto& path = vm["config"].as<std::string>();
  auto stream = std::ifstream{path};
  if (!stream) {
    throw po::error{"cannot open config file '" + path + "'"};
  }
  po::store(po::parse_config_file(stream, description), vm);
  po::notify(vm);
}

operation_result<settings> make_settings(const po::variables_map& vm) {
  auto result = settings{};
  result.db_path = vm["db-path"].as<std::string>();
  if (result.db_path.empty()) {
    return make_failure<settings>(error_code::validation_failed, kCodespace,
                                  "db-path must not be empty");
  }

  result.service.directory.authority_id = vm["authority-id"].as<std::string>();
  if (result.service.directory.authority_id.empty()) {
    return make_failure<settings>(error_code::validation_failed, kCodespace,
                                  "authority-id must not be empty");
  }

  const auto& stake = vm["minimum-stake"].as<std::string>();
  auto minimum_stake = try_parse_amount(stake);
  if (!minimum_stake) {
    return make_failure<settings>(error_code::validation_failed, kCodespace,
                                  "minimum-stake must be a decimal amount",
                                  stake);
  }
  result.service.directory.minimum_stake = *minimum_stake;

  const auto& policy_name = vm["confidence-policy"].as<std::string>();
  auto policy = try_parse_policy(policy_name);
  if (!policy) {
    return make_failure<settings>(
        error_code::validation_failed, kCodespace,
        "confidence-policy must be simple-average or weighted-blend",
        policy_name);
  }
  result.service.confidence_policy = *policy;

  const auto& level_name = vm["log-level"].as<std::string>();
  result.log_level = spdlog::level::from_str(level_name);
  if (result.log_level == spdlog::level::off && level_name != "off") {
    return make_failure<settings>(error_code::validation_failed, kCodespace,
                                  "unknown log-level", level_name);
  }

  if (vm.contains("log-file")) {
    result.log_file = vm["log-file"].as<std::string>();
  }
  return make_success(std::move(result));
}

std::optional<amount_t> try_parse_amount(const std::string_view text) {
  if (text.empty() || !std::ranges::all_of(text, [](const char c) {
        return c >= '0' && c <= '9';
      })) {
    return std::nullopt;
  }
  auto value = boost::multiprecision::cpp_int{std::string{text}};
  if (value > boost::multiprecision::cpp_int{
                  std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return amount_t{value};
}

std::optional<confidence_policy_t> try_parse_policy(
    const std::string_view text) {
  return from_string(text, kConfidencePolicyNames);
}

}  // namespace credence::config
