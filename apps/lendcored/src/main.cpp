#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

#include "lendcore/api/request.hpp"
#include "lendcore/api/request_router.hpp"
#include "lendcore/auth/authenticator.hpp"
#include "lendcore/common/errors.hpp"
#include "lendcore/common/time_utils.hpp"
#include "lendcore/config/config_loader.hpp"
#include "lendcore/journal/event_journal.hpp"
#include "lendcore/pool/lending_pool.hpp"
#include "lendcore/risk/liquidation_engine.hpp"
#include "lendcore/telemetry/telemetry_sink.hpp"
#include "lendcore/transfer/in_memory_asset.hpp"
#include "lendcore/wal/wal_writer.hpp"

namespace {

using namespace lendcore;

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [script_file]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./lendcore.toml or generates defaults\n"
            << "  script_file: Commands to run against the pool, one per line\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 1) {
    return std::filesystem::path{argv[1]};
  }

  std::filesystem::path default_paths[] = {
      "./lendcore.toml",
      "/etc/lendcore/lendcore.toml",
      std::filesystem::path{std::getenv("HOME") ? std::getenv("HOME") : ""} / ".config/lendcore/lendcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

struct Keyring {
  std::unordered_map<common::AccountId, auth::SecretKey> secrets;
  std::unordered_map<common::AccountId, std::uint64_t> nonces;

  void enroll(auth::Authenticator& authenticator, common::AccountId account) {
    if (secrets.count(account) != 0) {
      return;
    }
    auth::PublicKey public_key;
    auth::SecretKey secret_key;
    auth::Authenticator::generate_keypair(public_key, secret_key);
    authenticator.register_account(account, public_key);
    secrets.emplace(account, secret_key);
  }

  std::optional<std::vector<std::byte>> sign(api::Request request) {
    auto it = secrets.find(request.caller);
    if (it == secrets.end()) {
      return std::nullopt;
    }
    request.nonce = ++nonces[request.caller];
    return auth::Authenticator::sign_frame(it->second, api::encode_request(request));
  }
};

void print_status(const pool::LendingPool& lending_pool, common::AccountId account) {
  const auto lender = lending_pool.lender(account);
  const auto borrower = lending_pool.borrower(account);
  const auto assessment = lending_pool.assess(account);
  std::cout << "  account " << account << ": supplied=" << lender.amount_supplied
            << " collateral=" << borrower.collateral_deposited
            << " borrowed=" << borrower.amount_borrowed
            << " lifetime_borrowed=" << borrower.initial_borrow_amount
            << " repaid=" << borrower.amount_repaid
            << " debt=" << lending_pool.total_debt(account)
            << " liquidatable=" << (assessment.liquidatable() ? risk::to_string(assessment.trigger) : "no")
            << "\n";
}

// Returns false on a script syntax error.
bool run_command(const std::string& line,
                 std::size_t line_number,
                 common::ManualClock& clock,
                 pool::LendingPool& lending_pool,
                 api::RequestRouter& router,
                 Keyring& keyring) {
  std::istringstream in(line);
  std::string verb;
  if (!(in >> verb) || verb.front() == '#') {
    return true;
  }

  if (verb == "advance") {
    std::int64_t days_count = 0;
    if (!(in >> days_count) || days_count < 0) {
      std::cerr << "line " << line_number << ": advance expects a non-negative day count\n";
      return false;
    }
    clock.advance(common::days(days_count));
    std::cout << "[t=" << clock.now() << "] advanced " << days_count << " days\n";
    return true;
  }

  if (verb == "status") {
    common::AccountId account = 0;
    if (!(in >> account)) {
      std::cerr << "line " << line_number << ": status expects an account\n";
      return false;
    }
    const auto state = lending_pool.pool_state();
    std::cout << "[t=" << clock.now() << "] pool total_supplied=" << state.total_supplied
              << " fee_recipient=" << state.fee_recipient << "\n";
    print_status(lending_pool, account);
    return true;
  }

  const auto operation = api::parse_operation(verb);
  if (!operation) {
    std::cerr << "line " << line_number << ": unknown command '" << verb << "'\n";
    return false;
  }

  api::Request request{.operation = *operation};
  std::uint64_t argument = 0;
  if (!(in >> request.caller >> argument)) {
    std::cerr << "line " << line_number << ": " << verb << " expects <caller> <value>\n";
    return false;
  }
  if (*operation == api::Operation::kLiquidate || *operation == api::Operation::kSetFeeRecipient) {
    request.target = argument;
  } else {
    request.amount = argument;
  }

  const auto frame = keyring.sign(request);
  if (!frame) {
    std::cerr << "line " << line_number << ": account " << request.caller << " has no key\n";
    return false;
  }

  const auto outcome = router.handle(*frame);
  std::cout << "[t=" << clock.now() << "] " << verb << " by " << request.caller << ": ";
  if (!outcome.ok()) {
    std::cout << "rejected (" << outcome.detail << ")\n";
    return true;
  }
  std::cout << "ok";
  if (outcome.repayment) {
    std::cout << " principal=" << outcome.repayment->principal << " interest=" << outcome.repayment->interest
              << " fee=" << outcome.repayment->fee << (outcome.repayment->closed ? " closed" : "");
  }
  if (outcome.liquidation) {
    std::cout << " debt=" << outcome.liquidation->debt << " collateral=" << outcome.liquidation->collateral
              << " trigger=" << risk::to_string(outcome.liquidation->trigger);
  }
  std::cout << "\n";
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace lendcore;

  if (argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  auto config_path = find_config_path(argc, argv);
  config::EngineConfig cfg;

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return 1;
    }
    cfg = std::move(result.config);
  } else {
    std::cout << "Loading config from: " << config_path << "\n";
    auto result = config::ConfigLoader::load(config_path);
    if (!result.success) {
      if (!result.raw_error.empty()) {
        std::cerr << "Parse error: " << result.raw_error << "\n";
      }
      for (const auto& err : result.errors) {
        std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
      }
      return 1;
    }
    cfg = std::move(result.config);
  }

  std::cout << "Config loaded successfully\n";
  std::cout << "  Owner: " << cfg.pool.owner << "\n";
  std::cout << "  Collateral ratio: " << cfg.pool.collateral_ratio_bp << "bp\n";
  std::cout << "  Accounts: " << cfg.accounts.size() << "\n";
  std::cout << "  Journal: " << (cfg.journal.enabled ? cfg.journal.path.string() : "disabled") << "\n";

  transfer::InMemoryAsset base_asset{"BASE"};
  transfer::InMemoryAsset collateral_asset{"COLL"};
  common::ManualClock clock{cfg.pool.start_time};
  std::cout << "  Assets: " << base_asset.symbol() << " lent against " << collateral_asset.symbol() << "\n";

  std::unique_ptr<pool::LendingPool> lending_pool;
  try {
    lending_pool = std::make_unique<pool::LendingPool>(
        pool::PoolConfig{
            .owner = cfg.pool.owner,
            .fee_recipient = cfg.pool.fee_recipient,
            .collateral_ratio_bp = static_cast<common::BasisPoints>(cfg.pool.collateral_ratio_bp),
            .protocol_fee_bp = static_cast<common::BasisPoints>(cfg.pool.protocol_fee_bp),
        },
        base_asset, collateral_asset, clock);
  } catch (const common::LendingError& ex) {
    std::cerr << "Failed to create pool: " << ex.what() << "\n";
    return 1;
  }

  auth::Authenticator authenticator;
  Keyring keyring;
  keyring.enroll(authenticator, cfg.pool.owner);
  keyring.enroll(authenticator, cfg.pool.fee_recipient);

  for (const auto& account : cfg.accounts) {
    keyring.enroll(authenticator, account.id);
    base_asset.mint(account.id, static_cast<common::Amount>(account.base_balance));
    collateral_asset.mint(account.id, static_cast<common::Amount>(account.collateral_balance));
    // Scripted accounts authorize the pool without limit.
    base_asset.approve(account.id, std::numeric_limits<common::Amount>::max());
    collateral_asset.approve(account.id, std::numeric_limits<common::Amount>::max());
  }
  std::cout << "  Auth: " << authenticator.account_count() << " registered accounts\n";

  std::unique_ptr<wal::Writer> wal;
  std::unique_ptr<journal::EventJournal> event_journal;
  if (cfg.journal.enabled) {
    try {
      if (const auto dir = cfg.journal.path.parent_path(); !dir.empty()) {
        std::filesystem::create_directories(dir);
      }
      wal = std::make_unique<wal::Writer>(cfg.journal.path, static_cast<std::size_t>(cfg.journal.flush_threshold));
    } catch (const std::exception& ex) {
      std::cerr << "Failed to open journal: " << ex.what() << "\n";
      return 1;
    }
    event_journal = std::make_unique<journal::EventJournal>(*wal);
    lending_pool->set_event_sink(event_journal.get());
  }

  telemetry::TelemetrySink telemetry;
  if (cfg.telemetry.enabled) {
    lending_pool->set_telemetry(&telemetry);
  }

  api::RequestRouter router{*lending_pool, authenticator};
  std::cout << "lendcored bootstrapped successfully\n";

  if (argc > 2) {
    std::ifstream script(argv[2]);
    if (!script) {
      std::cerr << "Failed to open script: " << argv[2] << "\n";
      return 1;
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(script, line)) {
      ++line_number;
      try {
        if (!run_command(line, line_number, clock, *lending_pool, router, keyring)) {
          return 1;
        }
      } catch (const std::exception& ex) {
        std::cerr << "line " << line_number << ": fatal: " << ex.what() << "\n";
        return 1;
      }
    }
  }

  if (wal) {
    try {
      wal->sync();
    } catch (const std::exception& ex) {
      std::cerr << "Failed to sync journal: " << ex.what() << "\n";
      return 1;
    }
    std::cout << "Journaled " << event_journal->published() << " events to " << wal->path() << "\n";
  }

  for (const auto& sample : telemetry.drain_counters()) {
    std::cout << "  " << pool::to_string(static_cast<pool::Metric>(sample.id)) << ": " << sample.value << "\n";
  }
  for (const auto& summary : telemetry.drain_latency()) {
    std::cout << "  " << pool::to_string(static_cast<pool::Metric>(summary.id)) << " latency: mean="
              << summary.mean_ns << "ns p99=" << summary.p99_ns << "ns\n";
  }

  return 0;
}
