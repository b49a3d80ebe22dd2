#pragma once

#include <spdlog/common.h>
#include <boost/program_options.hpp>
#include <credence/schema/operation_result.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/service/registry_service.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace credence::config {

inline constexpr std::string_view kDefaultDatabasePath{"credence.db"};

/// Runtime settings shared by every CLI command.
struct settings final {
  std::string db_path{kDefaultDatabasePath};
  credence::service::service_options service;
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::optional<std::string> log_file;
};

/// Options understood on the command line and in a `--config` file.
boost::program_options::options_description make_general_options();

/// Merge the INI-style file named by `--config` into `vm`. Values already
/// present (from the command line) take precedence. Throws
/// boost::program_options::error when the file cannot be read or parsed.
void load_config_file(boost::program_options::variables_map& vm,
                      const boost::program_options::options_description&
                          description);

/// Validate the general options and build settings from them.
credence::schema::operation_result<settings> make_settings(
    const boost::program_options::variables_map& vm);

/// Parse a non-negative decimal amount that fits in 256 bits.
std::optional<credence::schema::amount_t> try_parse_amount(
    std::string_view text);

std::optional<credence::schema::confidence_policy_t> try_parse_policy(
    std::string_view text);

}  // namespace credence::config
