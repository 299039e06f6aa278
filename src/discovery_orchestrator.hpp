#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "capabilities.hpp"
#include "connection_guard.hpp"
#include "log.hpp"
#include "share_models.hpp"

// Runs time-bounded, deduplicated scans for shares and keeps the list of
// manually validated shares. State machine: Idle -> Scanning -> Idle.
class DiscoveryOrchestrator {
public:
  struct Options {
    std::chrono::milliseconds scan_timeout{10000};
    std::chrono::milliseconds connection_timeout{kDefaultConnectionTimeout};
  };

  struct Stats {
    std::uint64_t scans_started = 0;
    std::size_t queried_hosts = 0;
    std::size_t enumerations_in_flight = 0;
    std::size_t discovered_shares = 0;
    std::size_t manual_shares = 0;
  };

  using ChangeCallback = std::function<void()>;

  DiscoveryOrchestrator(std::shared_ptr<HostDiscoverer> host_discoverer,
                        std::shared_ptr<ShareEnumerator> share_enumerator,
                        std::shared_ptr<ConnectionTester> connection_tester,
                        Options options,
                        std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryOrchestrator();

  DiscoveryOrchestrator(const DiscoveryOrchestrator&) = delete;
  DiscoveryOrchestrator& operator=(const DiscoveryOrchestrator&) = delete;

  // No-op while a scan is running. Waits for a scan that is still stopping
  // its discoverer.
  void start_discovery();
  // No-op while idle. Shares found so far stay readable until the next start.
  void stop_discovery();
  void rescan();

  // Throws ConnectionError. Returns the validated share; a share already in
  // the manual or discovered list is returned without being added again.
  // The duplicate check and the append see one view of both lists.
  DiscoveredShare add_manual_share(const ManualShareInput& input);
  void remove_manual_share(const DiscoveredShare& share);

  std::vector<DiscoveredShare> shares() const;
  std::vector<DiscoveredShare> manual_shares() const;
  // Manual shares first, each group sorted by display name ignoring case.
  std::vector<DiscoveredShare> all_shares() const;
  bool is_scanning() const;
  Stats stats() const;

  // Called after the discovered list, the manual list or the scanning flag
  // changes. Runs on whichever thread made the change.
  void set_change_callback(ChangeCallback cb);

  const Options& options() const { return options_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  struct ScanSession;

  void run_host_loop(std::shared_ptr<ScanSession> session, std::shared_ptr<HostStream> stream);
  void dispatch_enumeration(const std::shared_ptr<ScanSession>& session, const DiscoveredHost& host);
  void enumerate_host(std::shared_ptr<ScanSession> session, DiscoveredHost host);
  std::size_t merge_shares(ScanSession& session, const std::vector<DiscoveredShare>& found);
  void arm_scan_timer(const std::shared_ptr<ScanSession>& session);
  bool end_session(const std::shared_ptr<ScanSession>& session, const char* reason);
  // Requires lifecycle_m_. False when the session is no longer current.
  bool retire_session(const std::shared_ptr<ScanSession>& session, std::size_t& found);
  void reap_retired_sessions(bool wait_all);
  void notify_changed();

  // io_ is declared first so that it outlives every timer owned by a session.
  asio::io_context io_;
  asio::executor_work_guard<asio::io_context::executor_type> work_;
  std::thread io_thread_;

  Options options_;
  std::shared_ptr<HostDiscoverer> host_discoverer_;
  std::shared_ptr<ShareEnumerator> share_enumerator_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<ConnectionTester> connection_tester_;

  // Held across discover_hosts() and stop_discovery() on the discoverer, so a
  // session ending late can never stop the discovery of the next one.
  std::mutex lifecycle_m_;

  mutable std::mutex state_m_;
  bool scanning_ = false;
  std::uint64_t session_counter_ = 0;
  std::shared_ptr<ScanSession> current_session_;
  std::shared_ptr<ScanSession> last_session_;
  std::vector<std::shared_ptr<ScanSession>> retired_sessions_;

  mutable std::mutex manual_m_;
  std::vector<DiscoveredShare> manual_shares_;

  std::mutex callback_m_;
  ChangeCallback change_callback_;
};
