#pragma once

namespace lendcore::tests {

void test_interest_schedule();
void test_borrow_limits();
void test_repay_accounting();
void test_debt_views();

}  // namespace lendcore::tests
