#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <credence/common/critical.hpp>
#include <credence/config/options.hpp>
#include <credence/crypto/digest.hpp>
#include <credence/service/registry_service.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace po = boost::program_options;
using namespace credence::schema;

namespace {

void configure_logging(const credence::config::settings& settings) {
  spdlog::init_thread_pool(8192, 1);

  // Logs go to stderr so command output on stdout stays machine readable.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (settings.log_file) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        *settings.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "credence", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(settings.log_level);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    credence::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

degree_id_t require_degree_id(const po::variables_map& vm) {
  auto degree_id = try_make_hash32(require(vm, "degree"));
  if (!degree_id) {
    credence::common::critical("--degree must be 64 hex characters");
  }
  return *degree_id;
}

bytes_t read_file(const std::string& path) {
  auto stream = std::ifstream{path, std::ios::binary};
  if (!stream) {
    credence::common::critical("cannot open '{}'", path);
  }
  return bytes_t{std::istreambuf_iterator<char>{stream},
                 std::istreambuf_iterator<char>{}};
}

subject_fields_t read_subject_fields(const po::variables_map& vm) {
  auto fields = subject_fields_t{};
  auto assign = [&](const std::string& option, const subject_field_t field) {
    if (vm.contains(option)) {
      fields.get(field) = vm[option].as<std::string>();
    }
  };
  assign("student-name", subject_field_t::student_name);
  assign("degree-name", subject_field_t::degree_name);
  assign("institution-name", subject_field_t::institution_name);
  assign("issuance-date", subject_field_t::issuance_date);
  assign("certificate-number", subject_field_t::certificate_number);
  return fields;
}

template <typename T>
int report_failure(const operation_result<T>& result) {
  std::cerr << "error " << to_string(result.code) << " ["
            << result.codespace << "]: " << result.log;
  if (!result.info.empty()) {
    std::cerr << " (" << result.info << ")";
  }
  std::cerr << '\n';
  return 1;
}

void print(const organization_t& organization) {
  std::cout << organization.organization_id << '\t'
            << to_string(organization.status) << '\t' << organization.name
            << '\t' << organization.stake.str();
  if (organization.status_reason) {
    std::cout << '\t' << *organization.status_reason;
  }
  std::cout << '\n';
}

void print(const degree_record_t& record) {
  std::cout << "degree_id: " << to_hex(record.degree_id) << '\n'
            << "certificate_hash: " << record.certificate_hash << '\n'
            << "issuer: " << record.issuer << '\n'
            << "status: " << to_string(record.status) << '\n'
            << "verification_count: " << record.verification_count << '\n'
            << "submitted_at: " << record.submitted_at << '\n';
  if (record.last_verified_at) {
    std::cout << "last_verified_at: " << *record.last_verified_at << '\n';
  }
  for (auto field : kKeySubjectFields) {
    if (const auto& value = record.subject.get(field)) {
      std::cout << to_string(field) << ": " << *value << '\n';
    }
  }
  if (record.revocation) {
    std::cout << "revoked_by: " << record.revocation->revoked_by << '\n'
              << "revoked_at: " << record.revocation->revoked_at << '\n'
              << "revocation_reason: " << record.revocation->reason << '\n';
  }
}

void print(const verification_result_t& result) {
  std::cout << "verified: " << (result.verified ? "true" : "false") << '\n'
            << "confidence: " << result.confidence << '\n'
            << "method: " << to_string(result.method) << '\n';
  if (result.degree_id) {
    std::cout << "degree_id: " << to_hex(*result.degree_id) << '\n';
  }
  if (result.field_confidence) {
    std::cout << "field_confidence: " << *result.field_confidence << '\n';
  }
  if (result.event_id) {
    std::cout << "event_id: " << *result.event_id << '\n';
  }
}

int run(const std::string& command,
        const po::variables_map& vm,
        credence::service::registry_service& service) {
  if (command == "register-org") {
    auto stake_text = require(vm, "stake");
    auto stake = credence::config::try_parse_amount(stake_text);
    if (!stake) {
      credence::common::critical("--stake must be a decimal amount");
    }
    auto metadata = organization_metadata_t{};
    metadata.name = require(vm, "name");
    if (vm.contains("country")) {
      metadata.country = vm["country"].as<std::string>();
    }
    if (vm.contains("email")) {
      metadata.contact_email = vm["email"].as<std::string>();
    }
    auto result =
        service.register_organization(require(vm, "org"), metadata, *stake);
    if (!result) {
      return report_failure(result);
    }
    print(*result.value);
    return 0;
  }

  if (command == "approve-org" || command == "suspend-org" ||
      command == "blacklist-org") {
    auto organization_id = require(vm, "org");
    auto acting = require(vm, "acting");
    auto result =
        command == "approve-org"
            ? service.approve_organization(organization_id, acting)
        : command == "suspend-org"
            ? service.suspend_organization(organization_id,
                                           require(vm, "reason"), acting)
            : service.blacklist_organization(organization_id,
                                             require(vm, "reason"), acting);
    if (!result) {
      return report_failure(result);
    }
    print(*result.value);
    return 0;
  }

  if (command == "list-orgs") {
    auto result = service.list_organizations();
    if (!result) {
      return report_failure(result);
    }
    for (const auto& organization : *result.value) {
      print(organization);
    }
    return 0;
  }

  if (command == "submit" || command == "submit-document") {
    auto issuer = require(vm, "issuer");
    auto subject = read_subject_fields(vm);
    auto result = [&] {
      if (command == "submit") {
        return service.submit_degree(issuer, require(vm, "hash"), subject);
      }
      auto document = read_file(require(vm, "file"));
      return service.submit_document(
          issuer, bytes_view_t{document.data(), document.size()}, subject);
    }();
    if (!result) {
      return report_failure(result);
    }
    std::cout << to_hex(*result.value) << '\n';
    return 0;
  }

  if (command == "verify") {
    auto presented = read_subject_fields(vm);
    auto result = service.verify(
        require(vm, "hash"),
        presented.empty() ? std::nullopt : std::optional{presented},
        require(vm, "verifier"));
    if (!result) {
      return report_failure(result);
    }
    print(*result.value);
    return result.value->verified ? 0 : 3;
  }

  if (command == "revoke") {
    auto result = service.revoke(require_degree_id(vm), require(vm, "reason"),
                                 require(vm, "acting"));
    if (!result) {
      return report_failure(result);
    }
    print(*result.value);
    return 0;
  }

  if (command == "show") {
    auto reference =
        vm.contains("degree")
            ? credence::service::degree_reference_t{require_degree_id(vm)}
            : credence::service::degree_reference_t{require(vm, "hash")};
    auto result = service.get_degree(reference);
    if (!result) {
      return report_failure(result);
    }
    print(*result.value);
    return 0;
  }

  if (command == "history") {
    auto degree_id = require_degree_id(vm);
    auto verifications = service.get_verification_history(degree_id);
    if (!verifications) {
      return report_failure(verifications);
    }
    auto revocations = service.get_revocation_history(degree_id);
    if (!revocations) {
      return report_failure(revocations);
    }
    for (const auto& event : *revocations.value) {
      std::cout << event.event_id << '\t' << event.recorded_at << "\tREVOKED\t"
                << event.acting_organization << '\t' << event.reason << '\n';
    }
    for (const auto& event : *verifications.value) {
      std::cout << event.event_id << '\t' << event.recorded_at << '\t'
                << to_string(event.method) << '\t' << event.verifier << '\t'
                << event.confidence << '\n';
    }
    return 0;
  }

  if (command == "list-degrees") {
    auto result = service.list_degrees_by_issuer(require(vm, "issuer"));
    if (!result) {
      return report_failure(result);
    }
    for (const auto& record : *result.value) {
      std::cout << to_hex(record.degree_id) << '\t' << record.certificate_hash
                << '\t' << to_string(record.status) << '\n';
    }
    return 0;
  }

  credence::common::critical("unknown command '{}'", command);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  credence register-org --org ID --name NAME --stake N\n"
            << "  credence approve-org|suspend-org|blacklist-org --org ID "
               "--acting ID [--reason TEXT]\n"
            << "  credence list-orgs\n"
            << "  credence submit --issuer ID --hash HEX [fields]\n"
            << "  credence submit-document --issuer ID --file PATH [fields]\n"
            << "  credence verify --hash HEX --verifier ID [fields]\n"
            << "  credence revoke --degree ID --reason TEXT --acting ID\n"
            << "  credence show --degree ID | --hash HEX\n"
            << "  credence history --degree ID\n"
            << "  credence list-degrees --issuer ID\n"
            << "  credence hash --file PATH\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto general = credence::config::make_general_options();
  auto options = po::options_description{"Command options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "command to run")(
      "org", po::value<std::string>(), "organization id")(
      "name", po::value<std::string>(), "organization name")(
      "country", po::value<std::string>(), "organization country")(
      "email", po::value<std::string>(), "organization contact email")(
      "stake", po::value<std::string>(), "stake amount")(
      "acting", po::value<std::string>(), "acting organization id")(
      "reason", po::value<std::string>(), "status change or revocation reason")(
      "issuer", po::value<std::string>(), "issuing organization id")(
      "verifier", po::value<std::string>(), "verifying organization id")(
      "hash", po::value<std::string>(), "certificate hash (64 hex)")(
      "degree", po::value<std::string>(), "degree id (64 hex)")(
      "file", po::value<std::string>(), "certificate document path")(
      "student-name", po::value<std::string>(), "subject student name")(
      "degree-name", po::value<std::string>(), "subject degree name")(
      "institution-name", po::value<std::string>(),
      "subject institution name")(
      "issuance-date", po::value<std::string>(), "subject issuance date")(
      "certificate-number", po::value<std::string>(),
      "subject certificate number");
  auto all = po::options_description{"credence"};
  all.add(general).add(options);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
    credence::config::load_config_file(vm, general);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(all);
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(all);
    return 0;
  }

  auto settings = credence::config::make_settings(vm);
  if (!settings) {
    return report_failure(settings);
  }
  configure_logging(*settings.value);

  if (command == "hash") {
    auto document = read_file(require(vm, "file"));
    std::cout << credence::crypto::certificate_hash(
                     bytes_view_t{document.data(), document.size()})
              << '\n';
    spdlog::shutdown();
    return 0;
  }

  auto status = 0;
  try {
    auto encoder = credence::scale_encoder_t{};
    auto storage = credence::storage::make_storage<
        credence::storage::rocksdb_storage_tag>(settings.value->db_path);
    auto service = credence::service::registry_service{
        encoder, storage, settings.value->service};
    auto authority = service.bootstrap();
    if (!authority) {
      status = report_failure(authority);
    } else {
      status = run(command, vm, service);
    }
  } catch (const credence::storage::storage_error& ex) {
    spdlog::error("Registry store unavailable: {}", ex.what());
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
