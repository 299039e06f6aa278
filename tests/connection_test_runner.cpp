#include "connection_guard.hpp"
#include "connection_status_checker.hpp"
#include "share_errors.hpp"
#include "test_doubles.hpp"
#include "test_runner_utils.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using sharewatch::test::FakeConnectionTester;
using sharewatch::test::TestCase;
using sharewatch::test::TestContext;
using sharewatch::test::wait_for_condition;

namespace {

template<typename Fn>
std::optional<ConnectionError::Kind> error_kind_of(Fn&& fn) {
  try {
    fn();
  } catch(const ConnectionError& e) {
    return e.kind();
  }
  return std::nullopt;
}

bool test_guarded_tester_validates_first(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  GuardedConnectionTester guarded(inner, 500ms);
  auto bad_host = error_kind_of([&]{ guarded.test_connection("two words", "Movies", std::nullopt); });
  auto bad_share = error_kind_of([&]{ guarded.test_connection("nas.local", "  ", std::nullopt); });
  ctx.expect(bad_host == ConnectionError::Kind::InvalidHostname, "invalid host rejected");
  ctx.expect(bad_share == ConnectionError::Kind::InvalidSharePath, "invalid share rejected");
  return ctx.expect(inner->calls.load() == 0, "inner tester never called");
}

bool test_guarded_tester_trims_input(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  GuardedConnectionTester guarded(inner, 500ms);
  auto share = guarded.test_connection("  nas.local ", " Movies ", ShareCredentials{"u", "p"});
  ctx.expect(share.host_address == "nas.local" && share.share_name == "Movies", "trimmed values reach the tester");
  return ctx.expect(inner->last_credentials && inner->last_credentials->username == "u", "credentials forwarded");
}

bool test_guarded_tester_times_out(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  inner->delay = 300ms;
  auto logger = std::make_shared<Logger>("connection");
  ctx.logs.attach(logger);
  GuardedConnectionTester guarded(inner, 30ms, logger);

  auto started = std::chrono::steady_clock::now();
  auto kind = error_kind_of([&]{ guarded.test_connection("10.0.0.5", "Movies", std::nullopt); });
  auto elapsed = std::chrono::steady_clock::now() - started;
  ctx.expect(kind == ConnectionError::Kind::ConnectionTimeout, "timeout kind");
  ctx.expect(elapsed < 250ms, "caller released at the deadline");
  return ctx.expect(ctx.logs.contains("timed out after 30 ms"), "timeout logged");
}

bool test_guarded_tester_propagates_errors(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  inner->error = ConnectionError::share_not_found("Movies");
  GuardedConnectionTester guarded(inner, 500ms);
  auto kind = error_kind_of([&]{ guarded.test_connection("10.0.0.5", "Movies", std::nullopt); });
  return ctx.expect(kind == ConnectionError::Kind::ShareNotFound, "inner error unchanged");
}

bool test_hanging_attempts_are_bounded(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  inner->delay = 300ms;
  auto logger = std::make_shared<Logger>("connection");
  ctx.logs.attach(logger);
  GuardedConnectionTester guarded(inner, 20ms, logger, 2);

  for(int i = 0; i < 2; ++i) {
    auto kind = error_kind_of([&]{ guarded.test_connection("10.0.0.5", "Movies", std::nullopt); });
    ctx.expect(kind == ConnectionError::Kind::ConnectionTimeout, "slow attempt times out");
  }
  ctx.expect(guarded.hanging_attempts() == 2, "two attempts left running");

  auto refused = error_kind_of([&]{ guarded.test_connection("10.0.0.5", "Movies", std::nullopt); });
  ctx.expect(refused == ConnectionError::Kind::ConnectionTimeout, "refused as a timeout");
  ctx.expect(inner->calls.load() == 2, "no third backend call while two hang");
  ctx.expect(ctx.logs.contains("earlier attempts still hanging"), "refusal logged");

  ctx.expect(wait_for_condition([&]{ return guarded.hanging_attempts() == 0; }, 1000ms),
             "hanging attempts drain when the backend returns");
  inner->delay = 0ms;
  auto share = guarded.test_connection("10.0.0.5", "Movies", std::nullopt);
  ctx.expect(share.share_name == "Movies", "attempts allowed again");
  return ctx.expect(inner->calls.load() == 3, "backend reached again");
}

bool test_concurrent_attempts_are_not_limited(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  inner->delay = 50ms;
  GuardedConnectionTester guarded(inner, 1000ms, nullptr, 1);
  std::atomic<int> succeeded{0};
  std::vector<std::thread> threads;
  for(int i = 0; i < 4; ++i) {
    threads.emplace_back([&]{
      try {
        guarded.test_connection("10.0.0.5", "Movies", std::nullopt);
        ++succeeded;
      } catch(const ConnectionError&) {
      }
    });
  }
  for(auto& t : threads) t.join();
  ctx.expect(succeeded.load() == 4, "attempts that finish in time never count against the limit");
  return ctx.expect(guarded.hanging_attempts() == 0, "nothing left hanging");
}

bool test_status_checker_mapping(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  ConnectionStatusChecker checker(inner, 500ms);
  auto share = SavedShare::make("NAS1", "10.0.0.5", "Movies");

  ctx.expect(checker.check_status(share, std::nullopt).is_online(), "successful connection is Online");

  inner->error = ConnectionError::host_unreachable("10.0.0.5");
  ctx.expect(checker.check_status(share, std::nullopt) == ConnectionStatus::offline("Cannot reach host: 10.0.0.5"),
             "errors become Offline with the description");

  inner->error = ConnectionError::authentication_failed();
  auto status = checker.check_status(share, ShareCredentials{"u", "wrong"});
  ctx.expect(status.reason() == "Authentication failed. Please check your username and password.", "auth reason");

  auto bad = SavedShare::make("NAS1", "", "Movies");
  return ctx.expect(checker.check_status(bad, std::nullopt) ==
                    ConnectionStatus::offline("Invalid hostname or IP address"), "validation folds into Offline");
}

bool test_status_checker_timeout(TestContext& ctx) {
  auto inner = std::make_shared<FakeConnectionTester>();
  inner->delay = 300ms;
  ConnectionStatusChecker checker(inner, 30ms);
  auto share = SavedShare::make("NAS1", "10.0.0.5", "Movies");
  return ctx.expect(checker.check_status(share, std::nullopt) == ConnectionStatus::offline("Connection timed out"),
                    "slow checks report a timeout");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"guarded_tester_validates_first", test_guarded_tester_validates_first},
    {"guarded_tester_trims_input", test_guarded_tester_trims_input},
    {"guarded_tester_times_out", test_guarded_tester_times_out},
    {"guarded_tester_propagates_errors", test_guarded_tester_propagates_errors},
    {"hanging_attempts_are_bounded", test_hanging_attempts_are_bounded},
    {"concurrent_attempts_are_not_limited", test_concurrent_attempts_are_not_limited},
    {"status_checker_mapping", test_status_checker_mapping},
    {"status_checker_timeout", test_status_checker_timeout},
  };
  return sharewatch::test::run_test_cases("connection", argc, argv, tests);
}
