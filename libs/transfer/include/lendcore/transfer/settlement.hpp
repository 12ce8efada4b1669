#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "lendcore/common/types.hpp"
#include "lendcore/transfer/asset_transfer.hpp"

namespace lendcore {
namespace transfer {

// Ordered asset movements for one ledger operation. Pulls must be added
// before pushes so that a failed push can be compensated by returning what
// was pulled.
class Settlement {
 public:
  enum class Direction : std::uint8_t {
    kPull,
    kPush,
  };

  struct Leg {
    AssetTransfer* asset{nullptr};
    Direction direction{Direction::kPull};
    common::AccountId account{};
    common::Amount amount{0};
  };

  void add_pull(AssetTransfer& asset, common::AccountId from, common::Amount amount);
  void add_push(AssetTransfer& asset, common::AccountId to, common::Amount amount);

  // Runs every leg in order. On the first failure the completed legs are
  // reversed and false is returned; a leg that throws is handled the same
  // way and the exception is rethrown. Throws if a reversal itself fails.
  [[nodiscard]] bool execute();

  [[nodiscard]] const std::vector<Leg>& legs() const noexcept { return legs_; }

 private:
  std::vector<Leg> legs_{};
  bool has_push_{false};

  // Reverses legs_[0, completed) newest first.
  void unwind(std::size_t completed);
  static bool run(const Leg& leg);
  static bool reverse(const Leg& leg);
};

}  // namespace transfer
}  // namespace lendcore
