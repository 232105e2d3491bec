#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <hybridwork/blake3/hash.hpp>
#include <hybridwork/common/command_line.hpp>
#include <hybridwork/execution/engine.hpp>
#include <hybridwork/fhe/simulated_coprocessor.hpp>
#include <hybridwork/schema/encoding/scale/encoder.hpp>
#include <hybridwork/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace hybridwork::schema;
using hybridwork::common::member_entry;
using hybridwork::common::parse_member;
using hybridwork::common::parse_preference;
using hybridwork::common::preference_entry;

namespace {

/// Command line identities are either 0x-prefixed 32 byte hex ids or names,
/// which the engine sees as their BLAKE3 digest.
hash32_t make_identity(const std::string_view name) {
  if (name.starts_with("0x")) {
    if (auto id = hybridwork::schema::try_make_hash32(name)) {
      return *id;
    }
  }
  return hybridwork::blake3::hash(name);
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

template <typename T>
bool report(const operation_result<T>& result, const std::string_view what) {
  if (result.ok()) {
    return true;
  }
  spdlog::error("{} failed [{} {}]: {}", what, result.codespace,
                static_cast<uint32_t>(result.code), result.log);
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto admin = std::string{};
  auto adjacency = std::string{};
  auto member_values = std::vector<std::string>{};
  auto preference_values = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"hybridwork"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "hybridwork.db"),
      "RocksDB directory")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace, debug, info, warn, error or critical")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write the log to this file")(
      "admin,a",
      boost::program_options::value<std::string>(&admin)->default_value(
          "admin"),
      "Name of the admin identity")(
      "overlap-adjacency",
      boost::program_options::value<std::string>(&adjacency)->default_value(
          "member_order"),
      "member_order or submission_order")(
      "member,m",
      boost::program_options::value<std::vector<std::string>>(&member_values)
          ->composing(),
      "team:employee, repeatable")(
      "preference,p",
      boost::program_options::value<std::vector<std::string>>(
          &preference_values)
          ->composing(),
      "employee:office,team,focus,flex, repeatable");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "hybridwork", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto policy = hybridwork::execution::overlap_adjacency_from_string(adjacency);
  if (!policy) {
    spdlog::error("Unknown overlap adjacency '{}'", adjacency);
    spdlog::shutdown();
    return 2;
  }

  auto members = std::vector<member_entry>{};
  for (const auto& value : member_values) {
    auto entry = parse_member(value);
    if (!entry) {
      spdlog::error("Malformed --member '{}'", value);
      spdlog::shutdown();
      return 2;
    }
    members.push_back(std::move(*entry));
  }
  auto preferences = std::vector<preference_entry>{};
  for (const auto& value : preference_values) {
    auto entry = parse_preference(value);
    if (!entry) {
      spdlog::error("Malformed --preference '{}'", value);
      spdlog::shutdown();
      return 2;
    }
    preferences.push_back(std::move(*entry));
  }

  auto storage =
      hybridwork::storage::make_storage<hybridwork::storage::rocksdb_storage_tag>(
          db_path);
  auto encoder = hybridwork::execution::scale_encoder_t{};
  auto coprocessor = hybridwork::fhe::simulated_coprocessor{};

  auto options = hybridwork::execution::engine_options{};
  options.admin = make_identity(admin);
  options.attestor = coprocessor.attestor();
  options.adjacency = *policy;
  auto engine =
      hybridwork::execution::engine{encoder, storage, coprocessor, options};
  engine.set_event_sink([](const schedule_event_t& event) {
    spdlog::debug("event {}", to_string(event.type));
  });

  auto succeeded = true;
  auto admin_context = call_context{.caller = options.admin,
                                    .now = now_milliseconds()};

  for (const auto& preference : preferences) {
    auto context = call_context{.caller = make_identity(preference.employee),
                                .now = now_milliseconds()};
    auto result = engine.submit_preference(
        context, coprocessor.encrypt_input(preference.values[0]),
        coprocessor.encrypt_input(preference.values[1]),
        coprocessor.encrypt_input(preference.values[2]),
        coprocessor.encrypt_input(preference.values[3]));
    succeeded &= report(result, "submit " + preference.employee);
  }

  auto teams = std::vector<std::string>{};
  for (const auto& member : members) {
    succeeded &= report(engine.add_member(admin_context,
                                          make_identity(member.team),
                                          make_identity(member.employee)),
                        "add " + member.employee + " to " + member.team);
    if (std::ranges::find(teams, member.team) == std::end(teams)) {
      teams.push_back(member.team);
    }
  }
  for (const auto& team : teams) {
    succeeded &= report(engine.optimize_team(admin_context, make_identity(team)),
                        "optimize " + team);
  }

  // An employee listed in several teams is assigned to the first one.
  auto assigned = std::vector<std::string>{};
  for (const auto& member : members) {
    if (std::ranges::find(assigned, member.employee) != std::end(assigned)) {
      continue;
    }
    auto result = engine.assign_personal(admin_context,
                                         make_identity(member.employee),
                                         make_identity(member.team));
    if (report(result, "assign " + member.employee)) {
      assigned.push_back(member.employee);
    } else {
      succeeded = false;
    }
  }

  for (const auto& employee : assigned) {
    auto context = call_context{.caller = make_identity(employee),
                                .now = now_milliseconds()};
    if (engine.reveal_status(context.caller) != reveal_status_t::revealed) {
      auto request = engine.request_reveal(context);
      if (!report(request, "request reveal for " + employee)) {
        succeeded = false;
        continue;
      }
      auto response = coprocessor.fulfil(*request.value);
      if (!response) {
        spdlog::error("Co-processor lost request for {}", employee);
        succeeded = false;
        continue;
      }
      auto resolved = engine.resolve_reveal(
          response->request_id, bytes_view_t{response->payload},
          response->proof, now_milliseconds());
      if (!report(resolved, "resolve reveal for " + employee)) {
        succeeded = false;
        continue;
      }
    }
    auto revealed = engine.revealed_schedule(context, context.caller);
    if (!report(revealed, "read schedule of " + employee)) {
      succeeded = false;
      continue;
    }
    std::cout << employee << ": office_days=" << revealed.value->office_days
              << " collab_days=" << revealed.value->collab_days << std::endl;
  }

  spdlog::info("Ledger holds {} record(s)", engine.ledger_size());
  spdlog::shutdown();
  return succeeded ? 0 : 1;
}
