#include "test_framework.hpp"

#include "tapbridge/observability/global.hpp"
#include "tapbridge/observability/noop_observer.hpp"

#include <csignal>
#include <iostream>
#include <memory>

void register_common_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_config_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_observability_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_transport_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_protocol_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_connection_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_sessions_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_security_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_directory_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_bridge_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_cli_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_config_integration_tests(std::vector<tapbridge::tests::TestCase> &tests);
void register_bridge_integration_tests(std::vector<tapbridge::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);
  tapbridge::observability::set_global_observer(
      std::make_unique<tapbridge::observability::NoopObserver>());

  std::vector<tapbridge::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_transport_tests(tests);
  register_protocol_tests(tests);
  register_connection_tests(tests);
  register_sessions_tests(tests);
  register_security_tests(tests);
  register_directory_tests(tests);
  register_bridge_tests(tests);
  register_cli_tests(tests);
  register_config_integration_tests(tests);
  register_bridge_integration_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";
  return failed == 0 ? 0 : 1;
}
