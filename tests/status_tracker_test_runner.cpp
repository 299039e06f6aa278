#include "status_tracker.hpp"
#include "test_doubles.hpp"
#include "test_runner_utils.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace std::chrono_literals;
using sharewatch::test::FakeStatusChecker;
using sharewatch::test::TestCase;
using sharewatch::test::TestContext;
using sharewatch::test::ThrowingStatusChecker;
using sharewatch::test::wait_for_condition;

namespace {

// Every (id, status) the tracker reports, in order.
class StatusLog {
public:
  void attach(StatusTracker& tracker) {
    tracker.set_status_callback([this](const ShareId& id, const ConnectionStatus& status){
      std::lock_guard lg(m_);
      entries_.emplace_back(id, status);
    });
  }

  std::vector<std::pair<ShareId, ConnectionStatus>> entries() const {
    std::lock_guard lg(m_);
    return entries_;
  }

  std::vector<ConnectionStatus> for_id(const ShareId& id) const {
    std::vector<ConnectionStatus> out;
    for(const auto& entry : entries()) {
      if(entry.first == id) out.push_back(entry.second);
    }
    return out;
  }

private:
  mutable std::mutex m_;
  std::vector<std::pair<ShareId, ConnectionStatus>> entries_;
};

struct Rig {
  std::shared_ptr<FakeStatusChecker> checker = std::make_shared<FakeStatusChecker>();
  std::shared_ptr<Logger> logger = std::make_shared<Logger>("status");
  std::unique_ptr<StatusTracker> tracker;
  StatusLog log;

  explicit Rig(TestContext& ctx) {
    ctx.logs.attach(logger);
    tracker = std::make_unique<StatusTracker>(checker, logger);
    log.attach(*tracker);
  }
};

SavedShare saved(const std::string& host, const std::string& share) {
  return SavedShare::make(host, host, share);
}

ShareCredentials creds(const std::string& user) {
  return ShareCredentials{user, "secret"};
}

bool test_untracked_status_is_unknown(TestContext& ctx) {
  Rig rig(ctx);
  ctx.expect(rig.tracker->status("nope") == ConnectionStatus::unknown(), "unknown id reads Unknown");
  ctx.expect(!rig.tracker->is_tracking("nope"), "not tracked");
  return ctx.expect(rig.tracker->statuses().empty(), "empty map");
}

bool test_start_tracking_is_non_destructive(TestContext& ctx) {
  Rig rig(ctx);
  rig.tracker->set_status(ConnectionStatus::online(), "x");
  rig.tracker->start_tracking("x");
  ctx.expect(rig.tracker->status("x").is_online(), "existing value kept");

  rig.tracker->start_tracking("y");
  ctx.expect(rig.tracker->is_tracking("y"), "new id tracked");
  ctx.expect(rig.tracker->status("y") == ConnectionStatus::unknown(), "new id starts Unknown");
  rig.tracker->start_tracking("y");
  return ctx.expect(rig.log.for_id("y").size() == 1, "second start_tracking writes nothing");
}

bool test_refresh_status_writes_result(TestContext& ctx) {
  Rig rig(ctx);
  auto share = saved("10.0.0.5", "Movies");
  rig.checker->set_result("bob", ConnectionStatus::offline("Share not found: Movies"));
  rig.tracker->refresh_status(share, creds("bob"));
  ctx.expect(rig.tracker->status(share.id) == ConnectionStatus::offline("Share not found: Movies"), "result stored");
  ctx.expect(rig.tracker->active_refresh_count() == 0, "task handle cleared");
  auto seen = rig.log.for_id(share.id);
  return ctx.expect(seen.size() == 2 && seen[0].is_checking() && !seen[1].is_checking(),
                    "Checking then the result");
}

bool test_later_refresh_wins_over_slower_earlier_one(TestContext& ctx) {
  Rig rig(ctx);
  auto share = saved("10.0.0.5", "Movies");
  rig.checker->set_result("slow", ConnectionStatus::offline("stale"), 300ms);
  rig.checker->set_result("fast", ConnectionStatus::online());

  std::thread first([&]{ rig.tracker->refresh_status(share, creds("slow")); });
  ctx.expect(wait_for_condition([&]{ return rig.checker->calls.load() == 1; }, 500ms), "first check running");
  rig.tracker->refresh_status(share, creds("fast"));
  ctx.expect(rig.tracker->status(share.id).is_online(), "second result stored");
  first.join();

  ctx.expect(rig.tracker->status(share.id).is_online(), "slow first check did not overwrite");
  auto seen = rig.log.for_id(share.id);
  ctx.expect(std::none_of(seen.begin(), seen.end(),
                          [](const ConnectionStatus& s){ return s == ConnectionStatus::offline("stale"); }),
             "stale result never written");
  ctx.expect(rig.tracker->active_refresh_count() == 0, "no live refresh left");
  return ctx.expect(ctx.logs.contains("superseded"), "supersession logged");
}

bool test_later_slower_refresh_still_wins(TestContext& ctx) {
  Rig rig(ctx);
  auto share = saved("10.0.0.5", "Movies");
  rig.checker->set_result("first", ConnectionStatus::online(), 100ms);
  rig.checker->set_result("second", ConnectionStatus::offline("Connection timed out"), 300ms);

  std::thread first([&]{ rig.tracker->refresh_status(share, creds("first")); });
  ctx.expect(wait_for_condition([&]{ return rig.checker->calls.load() == 1; }, 500ms), "first check running");
  std::thread second([&]{ rig.tracker->refresh_status(share, creds("second")); });
  first.join();
  ctx.expect(rig.tracker->status(share.id).is_checking(), "superseded result discarded");
  second.join();
  return ctx.expect(rig.tracker->status(share.id) == ConnectionStatus::offline("Connection timed out"),
                    "only the latest refresh writes");
}

bool test_refresh_all_statuses(TestContext& ctx) {
  Rig rig(ctx);
  auto a = saved("10.0.0.5", "Movies");
  auto b = saved("10.0.0.6", "Music");
  rig.checker->set_result("ok", ConnectionStatus::online(), 50ms);
  rig.checker->set_result("down", ConnectionStatus::offline("Host unreachable"), 50ms);
  rig.tracker->start_tracking(a.id);
  rig.tracker->start_tracking(b.id);

  std::vector<StatusTracker::RefreshRequest> requests;
  requests.emplace_back(a, creds("ok"));
  requests.emplace_back(b, creds("down"));
  rig.tracker->refresh_all_statuses(requests);

  auto statuses = rig.tracker->statuses();
  ctx.expect(statuses.size() == 2, "both tracked");
  ctx.expect(statuses[a.id].is_online(), "a online");
  ctx.expect(statuses[b.id] == ConnectionStatus::offline("Host unreachable"), "b offline with reason");

  // Both Checking marks precede either result.
  auto entries = rig.log.entries();
  std::vector<ConnectionStatus> after_tracking;
  for(const auto& entry : entries) {
    if(entry.second != ConnectionStatus::unknown()) after_tracking.push_back(entry.second);
  }
  ctx.expect(after_tracking.size() == 4, "two marks and two results");
  ctx.expect(after_tracking.size() == 4 && after_tracking[0].is_checking() && after_tracking[1].is_checking(),
             "Checking marks come first");
  return ctx.expect(rig.checker->calls.load() == 2, "one check per share");
}

bool test_refresh_all_runs_concurrently(TestContext& ctx) {
  Rig rig(ctx);
  rig.checker->set_result("", ConnectionStatus::online(), 200ms);
  std::vector<StatusTracker::RefreshRequest> requests;
  for(int i = 0; i < 5; ++i) {
    requests.emplace_back(saved("10.0.0." + std::to_string(i + 1), "Share"), std::nullopt);
  }
  auto started = std::chrono::steady_clock::now();
  rig.tracker->refresh_all_statuses(requests);
  auto elapsed = std::chrono::steady_clock::now() - started;
  ctx.expect(elapsed < 800ms, "checks overlap");
  auto statuses = rig.tracker->statuses();
  return ctx.expect(std::all_of(statuses.begin(), statuses.end(),
                                [](const auto& entry){ return entry.second.is_online(); }),
                    "every share online");
}

bool test_stop_tracking_discards_inflight(TestContext& ctx) {
  Rig rig(ctx);
  auto share = saved("10.0.0.5", "Movies");
  rig.checker->set_result("", ConnectionStatus::online(), 200ms);
  std::thread refresher([&]{ rig.tracker->refresh_status(share, std::nullopt); });
  ctx.expect(wait_for_condition([&]{ return rig.checker->calls.load() == 1; }, 500ms), "check running");
  rig.tracker->stop_tracking(share.id);
  refresher.join();
  ctx.expect(!rig.tracker->is_tracking(share.id), "entry stays removed");
  ctx.expect(rig.tracker->status(share.id) == ConnectionStatus::unknown(), "reads Unknown");
  return ctx.expect(ctx.logs.contains("Discarding result"), "discard logged");
}

bool test_set_status_cancels_refresh(TestContext& ctx) {
  Rig rig(ctx);
  auto share = saved("10.0.0.5", "Movies");
  rig.checker->set_result("", ConnectionStatus::online(), 200ms);
  std::thread refresher([&]{ rig.tracker->refresh_status(share, std::nullopt); });
  ctx.expect(wait_for_condition([&]{ return rig.checker->calls.load() == 1; }, 500ms), "check running");
  rig.tracker->set_status(ConnectionStatus::offline("disabled"), share.id);
  refresher.join();
  return ctx.expect(rig.tracker->status(share.id) == ConnectionStatus::offline("disabled"),
                    "direct write survives the refresh");
}

bool test_cancel_all_keeps_stored_values(TestContext& ctx) {
  Rig rig(ctx);
  auto steady = saved("10.0.0.5", "Movies");
  auto busy = saved("10.0.0.6", "Music");
  rig.tracker->set_status(ConnectionStatus::online(), steady.id);
  rig.checker->set_result("", ConnectionStatus::offline("late"), 200ms);

  std::thread refresher([&]{ rig.tracker->refresh_status(busy, std::nullopt); });
  ctx.expect(wait_for_condition([&]{ return rig.tracker->active_refresh_count() == 1; }, 500ms), "refresh live");
  rig.tracker->cancel_all_refreshes();
  ctx.expect(rig.tracker->active_refresh_count() == 0, "no live refresh");
  refresher.join();

  ctx.expect(rig.tracker->status(steady.id).is_online(), "stored value untouched");
  return ctx.expect(rig.tracker->status(busy.id).is_checking(), "cancelled refresh wrote nothing");
}

bool test_throwing_checker_reports_offline(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("status");
  ctx.logs.attach(logger);
  StatusTracker tracker(std::make_shared<ThrowingStatusChecker>(), logger);
  auto share = saved("10.0.0.5", "Movies");
  tracker.refresh_status(share, std::nullopt);
  ctx.expect(tracker.status(share.id) == ConnectionStatus::offline("checker exploded"), "exception folded into Offline");
  return ctx.expect(ctx.logs.contains("threw"), "warning logged");
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"untracked_status_is_unknown", test_untracked_status_is_unknown},
    {"start_tracking_is_non_destructive", test_start_tracking_is_non_destructive},
    {"refresh_status_writes_result", test_refresh_status_writes_result},
    {"later_refresh_wins_over_slower_earlier_one", test_later_refresh_wins_over_slower_earlier_one},
    {"later_slower_refresh_still_wins", test_later_slower_refresh_still_wins},
    {"refresh_all_statuses", test_refresh_all_statuses},
    {"refresh_all_runs_concurrently", test_refresh_all_runs_concurrently},
    {"stop_tracking_discards_inflight", test_stop_tracking_discards_inflight},
    {"set_status_cancels_refresh", test_set_status_cancels_refresh},
    {"cancel_all_keeps_stored_values", test_cancel_all_keeps_stored_values},
    {"throwing_checker_reports_offline", test_throwing_checker_reports_offline},
  };
  return sharewatch::test::run_test_cases("status", argc, argv, tests);
}
