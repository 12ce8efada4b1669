#include "lendcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <sstream>
#include <unordered_set>

namespace lendcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

// Account ids are unsigned; negative values are mapped to 0 so validation
// reports them as unset.
common::AccountId get_account_or(const toml::table& tbl, std::string_view key, common::AccountId default_val) {
  const auto raw = get_int_or(tbl, key, static_cast<std::int64_t>(default_val));
  return raw < 0 ? common::kNoAccount : static_cast<common::AccountId>(raw);
}

PoolSettings parse_pool(const toml::table& root) {
  PoolSettings cfg;
  if (auto* pool = root["pool"].as_table()) {
    cfg.owner = get_account_or(*pool, "owner", cfg.owner);
    cfg.fee_recipient = get_account_or(*pool, "fee_recipient", cfg.fee_recipient);
    cfg.collateral_ratio_bp = get_int_or(*pool, "collateral_ratio_bp", cfg.collateral_ratio_bp);
    cfg.protocol_fee_bp = get_int_or(*pool, "protocol_fee_bp", cfg.protocol_fee_bp);
    cfg.start_time = get_int_or(*pool, "start_time", cfg.start_time);
  }
  return cfg;
}

JournalConfig parse_journal(const toml::table& root) {
  JournalConfig cfg;
  if (auto* journal = root["journal"].as_table()) {
    cfg.enabled = get_bool_or(*journal, "enabled", cfg.enabled);
    cfg.path = get_str_or(*journal, "path", cfg.path.string());
    cfg.flush_threshold = get_int_or(*journal, "flush_threshold", cfg.flush_threshold);
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

std::vector<AccountConfig> parse_accounts(const toml::table& root) {
  std::vector<AccountConfig> accounts;
  if (auto* arr = root["accounts"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* account_tbl = elem.as_table()) {
        AccountConfig account;
        account.id = get_account_or(*account_tbl, "id", account.id);
        account.base_balance = get_int_or(*account_tbl, "base_balance", account.base_balance);
        account.collateral_balance = get_int_or(*account_tbl, "collateral_balance", account.collateral_balance);
        accounts.push_back(account);
      }
    }
  }
  return accounts;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.pool = parse_pool(root);
  cfg.journal = parse_journal(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.accounts = parse_accounts(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.pool.owner == common::kNoAccount) {
    errors.push_back({"pool.owner", "owner must be a non-zero account"});
  }

  if (config.pool.fee_recipient == common::kNoAccount) {
    errors.push_back({"pool.fee_recipient", "fee_recipient must be a non-zero account"});
  }

  if (config.pool.collateral_ratio_bp < 5'000 || config.pool.collateral_ratio_bp > 9'500) {
    errors.push_back({"pool.collateral_ratio_bp", "must be within [5000, 9500]"});
  }

  if (config.pool.protocol_fee_bp < 0 || config.pool.protocol_fee_bp > 10'000) {
    errors.push_back({"pool.protocol_fee_bp", "must be within [0, 10000]"});
  }

  if (config.pool.start_time < 0) {
    errors.push_back({"pool.start_time", "must not be negative"});
  }

  if (config.journal.enabled && config.journal.path.empty()) {
    errors.push_back({"journal.path", "path cannot be empty"});
  }

  if (config.journal.flush_threshold < 0) {
    errors.push_back({"journal.flush_threshold", "must not be negative"});
  }

  std::unordered_set<common::AccountId> seen;
  for (std::size_t i = 0; i < config.accounts.size(); ++i) {
    const auto& account = config.accounts[i];
    std::string prefix = "accounts[" + std::to_string(i) + "]";

    if (account.id == common::kNoAccount) {
      errors.push_back({prefix + ".id", "account id must be greater than 0"});
    } else if (!seen.insert(account.id).second) {
      errors.push_back({prefix + ".id", "duplicate account id " + std::to_string(account.id)});
    }

    if (account.base_balance < 0) {
      errors.push_back({prefix + ".base_balance", "must not be negative"});
    }

    if (account.collateral_balance < 0) {
      errors.push_back({prefix + ".collateral_balance", "must not be negative"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# lendcore configuration
# Generated default configuration

[pool]
owner = 1
fee_recipient = 2
collateral_ratio_bp = 8000   # borrow up to 80% of collateral
protocol_fee_bp = 100
start_time = 1700000000

[journal]
enabled = true
path = "/var/lib/lendcore/events.wal"
flush_threshold = 128

[telemetry]
enabled = true

[[accounts]]
id = 10   # lender
base_balance = 100000

[[accounts]]
id = 20   # borrower
base_balance = 20000
collateral_balance = 50000

[[accounts]]
id = 30   # liquidator
base_balance = 100000
)";
}

}  // namespace config
}  // namespace lendcore
