#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "share_models.hpp"

// Cooperative cancellation flag shared between a task and its owner.
// Cancelling never interrupts the task; the task checks before it writes.
class CancellationToken {
public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() const { flag_->store(true, std::memory_order_release); }
  bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

// Live sequence of hosts. Producers push until closed; the consumer blocks in
// next(). Either side may close.
class HostStream {
public:
  void push(DiscoveredHost host);
  void close();
  bool is_closed() const;

  // Blocks until a host is available or the stream is closed and drained.
  std::optional<DiscoveredHost> next();

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  std::deque<DiscoveredHost> pending_;
  bool closed_ = false;
};

class HostDiscoverer {
public:
  virtual ~HostDiscoverer() = default;

  // Starts browsing; the stream stays open until stop_discovery() or close().
  virtual std::shared_ptr<HostStream> discover_hosts() = 0;
  virtual void stop_discovery() = 0;
};

class ShareEnumerator {
public:
  virtual ~ShareEnumerator() = default;

  // Throws DiscoveryError. Administrative shares are already filtered out.
  virtual std::vector<DiscoveredShare> list_shares(const DiscoveredHost& host) = 0;
};

class ConnectionTester {
public:
  virtual ~ConnectionTester() = default;

  // Throws ConnectionError.
  virtual DiscoveredShare test_connection(const std::string& host,
                                          const std::string& share_name,
                                          const std::optional<ShareCredentials>& credentials) = 0;
};

class StatusChecker {
public:
  virtual ~StatusChecker() = default;

  // Never throws; failures are reported as ConnectionStatus::offline.
  virtual ConnectionStatus check_status(const SavedShare& share,
                                        const std::optional<ShareCredentials>& credentials) = 0;
};

// Administrative/hidden shares end with '$'.
bool is_administrative_share(const std::string& share_name);
std::vector<DiscoveredShare> filter_administrative_shares(std::vector<DiscoveredShare> shares);
