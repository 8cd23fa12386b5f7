#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tokenlock/storage/rocksdb/storage.hpp>
#include <tokenlock/vesting/calculator.hpp>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_rows(const std::string_view title,
                const std::vector<tokenlock::schema::vesting_milestone_t>& rows) {
  std::cout << title << '\n';
  for (const auto& row : rows) {
    std::cout << "  " << std::left << std::setw(12) << row.label
              << std::setw(12) << row.timestamp << std::setw(4)
              << static_cast<unsigned>(row.vested_percent) << "% "
              << tokenlock::schema::to_string(row.vested_amount) << '\n';
  }
}

void print_report(const tokenlock::schema::instance_state_t& state,
                  const tokenlock::schema::timestamp_seconds_t at) {
  using namespace tokenlock::schema;
  std::cout << "instance            " << to_string(state.instance) << '\n'
            << "token               " << to_string(state.token) << '\n'
            << "owner               " << to_string(state.owner) << '\n';
  if (!state.record.has_value()) {
    std::cout << "status              "
              << to_string(lockup_status_t::uninitialized) << '\n';
    return;
  }

  const auto& record = state.record.value();
  std::cout << "beneficiary         " << to_string(record.beneficiary) << '\n'
            << "total_amount        " << to_string(record.total_amount) << '\n'
            << "released_amount     " << to_string(record.released_amount)
            << '\n'
            << "start_time          " << record.start_time << '\n'
            << "cliff_duration      " << record.cliff_duration << '\n'
            << "vesting_duration    " << record.vesting_duration << '\n'
            << "revocable           " << std::boolalpha << record.revocable
            << '\n'
            << "revoked             " << record.revoked << '\n';
  if (record.revoked) {
    std::cout << "vested_at_revoke    " << to_string(record.vested_at_revoke)
              << '\n';
  }
  std::cout << "evaluated_at        " << at << '\n'
            << "status              "
            << to_string(tokenlock::vesting::status(record, at)) << '\n'
            << "vested              "
            << to_string(tokenlock::vesting::vested_amount(record, at)) << '\n'
            << "releasable          "
            << to_string(tokenlock::vesting::releasable_amount(record, at))
            << '\n'
            << "progress            "
            << static_cast<unsigned>(
                   tokenlock::vesting::vesting_progress(record, at))
            << "%\n"
            << "remaining_seconds   "
            << tokenlock::vesting::remaining_vesting_time(record, at) << '\n';
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "tokenlock-inspect.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "inspect", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto at = tokenlock::schema::timestamp_seconds_t{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"tokenlock-inspect"};
  description.add_options()("help,h", "Show the help message")(
      "db-path,d", boost::program_options::value<std::string>(&db_path),
      "RocksDB directory of a lockup instance")(
      "at,a",
      boost::program_options::value<tokenlock::schema::timestamp_seconds_t>(
          &at),
      "Evaluate at this unix time instead of now")(
      "timeline,t", "Print the milestone timeline and monthly breakdown")(
      "verbose,v", "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    spdlog::shutdown();
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (db_path.empty()) {
    spdlog::error("--db-path is required");
    std::cerr << description << std::endl;
    spdlog::shutdown();
    return 2;
  }

  if (!vm.contains("at")) {
    at = static_cast<tokenlock::schema::timestamp_seconds_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  }

  auto storage = tokenlock::storage::open_storage_read_only<
      tokenlock::storage::rocksdb_storage_tag>(db_path);
  auto state = storage.load_instance_state();
  if (!state.has_value()) {
    spdlog::error("No lockup instance persisted at {}", db_path);
    spdlog::shutdown();
    return 1;
  }

  print_report(state.value(), at);
  if (vm.contains("timeline") && state->record.has_value()) {
    print_rows("timeline", tokenlock::vesting::timeline(*state->record));
    auto monthly = tokenlock::vesting::monthly_breakdown(*state->record);
    if (!monthly.empty()) {
      print_rows("monthly", monthly);
    }
  }

  spdlog::shutdown();
  return 0;
}
