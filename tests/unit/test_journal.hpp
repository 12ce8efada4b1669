#pragma once

namespace lendcore::tests {

void test_event_journal();

}  // namespace lendcore::tests
