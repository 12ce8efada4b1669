#pragma once

namespace lendcore::tests {

void test_request_codec();
void test_request_router();

}  // namespace lendcore::tests
