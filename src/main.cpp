#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/common/error.hpp>
#include <warden/config/config.hpp>
#include <warden/sandbox.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split_fields(const std::string& value,
                                      const std::size_t expected,
                                      const std::string_view option) {
  auto parts = std::vector<std::string>{};
  auto start = std::size_t{0};
  while (true) {
    auto end = value.find(':', start);
    parts.push_back(value.substr(start, end - start));
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  if (parts.size() != expected) {
    throw warden::common::error{
        warden::common::error_code_t::invalid_input,
        fmt::format("--{} '{}' must have {} ':'-separated fields", option,
                    value, expected)};
  }
  return parts;
}

void print_transaction(const warden::schema::transaction_t& tx) {
  std::cout << fmt::format(
                   "{} {} {} {} {} -> {} [{}]", tx.transaction_id,
                   warden::schema::to_string(tx.status),
                   warden::schema::format_amount(tx.amount), tx.currency,
                   tx.from, tx.to, warden::schema::to_string(tx.mode))
            << (tx.rejection_reason ? " reason=" + *tx.rejection_reason : "")
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("warden.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Warden"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(),
      "INI configuration file")(
      "storage,s", boost::program_options::value<std::string>(),
      "RocksDB directory (same as storage.path)")(
      "account,a",
      boost::program_options::value<std::vector<std::string>>()->composing(),
      "Create account id:balance:currency (repeatable)")(
      "transfer,t",
      boost::program_options::value<std::vector<std::string>>()->composing(),
      "Simulate transfer from:to:amount:currency (repeatable)")(
      "evidence,e", "Build an evidence record over the whole chain")(
      "verify,v", "Verify chain links and signatures")(
      "stats", "Print audit counters and the per-tier breakdown")(
      "export,x", boost::program_options::value<std::string>(),
      "Write the SCALE-encoded chain to a file");
  description.add(warden::config::make_options());

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto input = std::ifstream{vm["config"].as<std::string>()};
      if (!input) {
        std::cerr << "cannot read " << vm["config"].as<std::string>()
                  << std::endl;
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(
              input, warden::config::make_options()),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto exit_code = 0;
  try {
    auto config = warden::config::from_variables(vm);
    if (vm.contains("storage")) {
      config.storage_path = vm["storage"].as<std::string>();
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    auto sandbox = warden::sandbox{config};
    auto& engine = sandbox.engine();

    if (vm.contains("account")) {
      for (const auto& value : vm["account"].as<std::vector<std::string>>()) {
        auto fields = split_fields(value, 3, "account");
        auto account = engine.create_account(
            fields[0], warden::schema::make_amount(fields[1]), fields[2],
            "cli");
        std::cout << fmt::format("account {} {} {}", account.id(),
                                 warden::schema::format_amount(
                                     account.balance()),
                                 account.currency())
                  << std::endl;
      }
    }

    if (vm.contains("transfer")) {
      for (const auto& value : vm["transfer"].as<std::vector<std::string>>()) {
        auto fields = split_fields(value, 4, "transfer");
        print_transaction(engine.simulate_transaction(
            fields[0], fields[1], warden::schema::make_amount(fields[2]),
            fields[3], "cli"));
      }
    }

    if (vm.contains("evidence")) {
      auto size = sandbox.audit_log().size();
      auto record = engine.build_evidence_record(
          warden::schema::log_range_t{.first = 0, .last = size - 1});
      std::cout << fmt::format("evidence {} [{}, {}] {}", record.record_id,
                               record.range.first, record.range.last,
                               warden::schema::to_hex(record.range_digest))
                << std::endl;
    }

    if (vm.contains("verify")) {
      auto verified = engine.verify_chain();
      std::cout << "chain " << (verified ? "verified" : "FAILED")
                << std::endl;
      if (!verified) {
        exit_code = 1;
      }
    }

    if (vm.contains("stats")) {
      auto stats = engine.statistics();
      std::cout << fmt::format(
                       "audit witnessed {} dropped {} size {} intact {}",
                       stats.audit.witnessed, stats.audit.dropped,
                       stats.audit.size, stats.audit.intact)
                << std::endl;
      for (const auto& [tier, count] : stats.audit.by_tier) {
        std::cout << fmt::format("tier {} {}", warden::schema::to_string(tier),
                                 count)
                  << std::endl;
      }
      std::cout << fmt::format("transactions {} open_approvals {} evidence {}",
                               stats.transactions, stats.open_approvals,
                               stats.evidence_records)
                << std::endl;
    }

    if (vm.contains("export")) {
      const auto& path = vm["export"].as<std::string>();
      auto bytes = sandbox.audit_log().export_events();
      auto output = std::ofstream{path, std::ios::binary};
      output.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
      if (!output) {
        throw warden::common::error{
            warden::common::error_code_t::invalid_input,
            fmt::format("cannot write {}", path)};
      }
      spdlog::info("exported {} bytes to {}", bytes.size(), path);
    }

    std::cout << fmt::format("mode {} head {} events {}",
                             warden::schema::to_string(engine.mode()),
                             warden::schema::to_hex(engine.chain_head()),
                             sandbox.audit_log().size())
              << std::endl;
  } catch (const warden::common::error& e) {
    spdlog::error("{}", e.what());
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
