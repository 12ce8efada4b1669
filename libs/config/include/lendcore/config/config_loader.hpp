#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "lendcore/common/types.hpp"

namespace lendcore {
namespace config {

struct PoolSettings {
  common::AccountId owner{1};
  common::AccountId fee_recipient{2};
  std::int64_t collateral_ratio_bp{8'000};
  std::int64_t protocol_fee_bp{100};
  common::Timestamp start_time{0};
};

struct JournalConfig {
  bool enabled{true};
  std::filesystem::path path{"/var/lib/lendcore/events.wal"};
  std::int64_t flush_threshold{128};
};

struct TelemetryConfig {
  bool enabled{true};
};

// Opening balances minted into the in-memory assets at startup.
struct AccountConfig {
  common::AccountId id{0};
  std::int64_t base_balance{0};
  std::int64_t collateral_balance{0};
};

struct EngineConfig {
  PoolSettings pool;
  JournalConfig journal;
  TelemetryConfig telemetry;
  std::vector<AccountConfig> accounts;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace lendcore
