#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "capabilities.hpp"
#include "log.hpp"
#include "share_models.hpp"

// Tracks the connection status of saved shares. At most one refresh per share
// id is live at a time: starting a refresh cancels the previous one, and only
// a refresh that is still live when its check returns may store its result.
class StatusTracker {
public:
  using StatusCallback = std::function<void(const ShareId&, const ConnectionStatus&)>;
  using RefreshRequest = std::pair<SavedShare, std::optional<ShareCredentials>>;

  explicit StatusTracker(std::shared_ptr<StatusChecker> checker,
                         std::shared_ptr<Logger> logger = nullptr);
  ~StatusTracker();

  StatusTracker(const StatusTracker&) = delete;
  StatusTracker& operator=(const StatusTracker&) = delete;

  // Unknown for ids that are not tracked.
  ConnectionStatus status(const ShareId& id) const;
  std::unordered_map<ShareId, ConnectionStatus> statuses() const;
  bool is_tracking(const ShareId& id) const;
  std::size_t active_refresh_count() const;

  // Creates an Unknown entry; an existing status is left untouched.
  void start_tracking(const ShareId& id);
  // Cancels any live refresh and forgets the id.
  void stop_tracking(const ShareId& id);

  // Marks the share Checking and blocks until its check has finished and the
  // result (if still wanted) is stored.
  void refresh_status(const SavedShare& share, const std::optional<ShareCredentials>& credentials);

  // Marks every share Checking in one step, then checks them concurrently.
  // Returns once every check has finished.
  void refresh_all_statuses(const std::vector<RefreshRequest>& requests);

  // Direct write. Cancels a live refresh so it cannot overwrite the value.
  void set_status(const ConnectionStatus& status, const ShareId& id);

  // Cancels every live refresh; stored statuses are kept.
  void cancel_all_refreshes();

  // Called after every stored write, outside the tracker's lock. May be
  // invoked from several threads at once.
  void set_status_callback(StatusCallback cb);

private:
  struct RefreshTask {
    std::uint64_t number = 0;
    CancellationToken token;
  };

  std::shared_ptr<RefreshTask> begin_refresh_locked(const ShareId& id);
  void run_refresh(const std::shared_ptr<RefreshTask>& task,
                   const SavedShare& share,
                   const std::optional<ShareCredentials>& credentials);
  void notify(const ShareId& id, const ConnectionStatus& status);

  std::shared_ptr<StatusChecker> checker_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  std::unordered_map<ShareId, ConnectionStatus> statuses_;
  std::unordered_map<ShareId, std::shared_ptr<RefreshTask>> refresh_tasks_;
  std::uint64_t refresh_counter_ = 0;

  std::mutex callback_m_;
  StatusCallback status_callback_;
};
