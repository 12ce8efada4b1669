// Unit test runner - calls test functions from per-component test files

#include <iostream>

#include "test_api.hpp"
#include "test_config.hpp"
#include "test_credit.hpp"
#include "test_journal.hpp"
#include "test_ledger.hpp"
#include "test_pool.hpp"
#include "test_risk.hpp"
#include "test_telemetry.hpp"
#include "test_transfer.hpp"

int main() {
  using namespace lendcore::tests;

  // Ledger tests
  test_ledger_store_checkpoint();
  test_supply_deposit_withdraw();
  test_supply_invariant();
  test_collateral_vault();

  // Credit tests
  test_interest_schedule();
  test_borrow_limits();
  test_repay_accounting();
  test_debt_views();

  // Risk tests
  test_liquidation_triggers();
  test_liquidation_execution();

  // Transfer tests
  test_in_memory_asset();
  test_settlement_unwind();

  // Pool tests
  test_pool_config_validation();
  test_pool_zero_amounts();
  test_pool_scenario_borrow_limit();
  test_pool_scenario_repay_with_interest();
  test_pool_scenario_matured_liquidation();
  test_pool_scenario_repayment_shortfall();
  test_pool_quirks();
  test_pool_rollback();
  test_pool_reentrancy();
  test_pool_sink_failure();
  test_pool_events_and_admin();

  // Persistence tests
  test_event_journal();

  // Config tests
  test_config_defaults();
  test_config_validation();

  // API tests
  test_request_codec();
  test_request_router();

  // Telemetry tests
  test_telemetry_sink();

  std::cout << "All unit tests passed\n";
  return 0;
}
