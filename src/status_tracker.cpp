#include "status_tracker.hpp"

#include <stdexcept>
#include <system_error>
#include <thread>

StatusTracker::StatusTracker(std::shared_ptr<StatusChecker> checker,
                             std::shared_ptr<Logger> logger)
  : checker_(std::move(checker)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("status")) {
  if(!checker_) {
    throw std::invalid_argument("StatusTracker requires a status checker");
  }
}

StatusTracker::~StatusTracker() {
  cancel_all_refreshes();
}

ConnectionStatus StatusTracker::status(const ShareId& id) const {
  std::lock_guard lg(m_);
  auto it = statuses_.find(id);
  if(it == statuses_.end()) return ConnectionStatus::unknown();
  return it->second;
}

std::unordered_map<ShareId, ConnectionStatus> StatusTracker::statuses() const {
  std::lock_guard lg(m_);
  return statuses_;
}

bool StatusTracker::is_tracking(const ShareId& id) const {
  std::lock_guard lg(m_);
  return statuses_.count(id) > 0;
}

std::size_t StatusTracker::active_refresh_count() const {
  std::lock_guard lg(m_);
  return refresh_tasks_.size();
}

void StatusTracker::start_tracking(const ShareId& id) {
  bool created = false;
  {
    std::lock_guard lg(m_);
    created = statuses_.emplace(id, ConnectionStatus::unknown()).second;
  }
  if(created) {
    notify(id, ConnectionStatus::unknown());
  }
}

void StatusTracker::stop_tracking(const ShareId& id) {
  std::lock_guard lg(m_);
  auto it = refresh_tasks_.find(id);
  if(it != refresh_tasks_.end()) {
    it->second->token.cancel();
    refresh_tasks_.erase(it);
  }
  statuses_.erase(id);
}

std::shared_ptr<StatusTracker::RefreshTask> StatusTracker::begin_refresh_locked(const ShareId& id) {
  auto task = std::make_shared<RefreshTask>();
  task->number = ++refresh_counter_;
  auto& slot = refresh_tasks_[id];
  if(slot) {
    slot->token.cancel();
    logger_->debug("Refresh {} for {} superseded by refresh {}", slot->number, id, task->number);
  }
  slot = task;
  statuses_[id] = ConnectionStatus::checking();
  return task;
}

void StatusTracker::refresh_status(const SavedShare& share,
                                   const std::optional<ShareCredentials>& credentials) {
  std::shared_ptr<RefreshTask> task;
  {
    std::lock_guard lg(m_);
    task = begin_refresh_locked(share.id);
  }
  notify(share.id, ConnectionStatus::checking());
  run_refresh(task, share, credentials);
}

void StatusTracker::refresh_all_statuses(const std::vector<RefreshRequest>& requests) {
  if(requests.empty()) return;

  std::vector<std::shared_ptr<RefreshTask>> tasks;
  tasks.reserve(requests.size());
  {
    std::lock_guard lg(m_);
    for(const auto& request : requests) {
      tasks.push_back(begin_refresh_locked(request.first.id));
    }
  }
  for(const auto& request : requests) {
    notify(request.first.id, ConnectionStatus::checking());
  }

  std::vector<std::thread> workers;
  workers.reserve(requests.size());
  for(std::size_t i = 0; i < requests.size(); ++i) {
    const auto& task = tasks[i];
    const auto& request = requests[i];
    try {
      workers.emplace_back([this, task, &request](){
        run_refresh(task, request.first, request.second);
      });
    } catch(const std::system_error& e) {
      logger_->warn("Checking {} inline, no thread available: {}", request.first.display_name, e.what());
      run_refresh(task, request.first, request.second);
    }
  }
  for(auto& worker : workers) {
    if(worker.joinable()) worker.join();
  }
}

void StatusTracker::run_refresh(const std::shared_ptr<RefreshTask>& task,
                                const SavedShare& share,
                                const std::optional<ShareCredentials>& credentials) {
  ConnectionStatus result;
  try {
    result = checker_->check_status(share, credentials);
  } catch(const std::exception& e) {
    logger_->warn("Status check for {} threw: {}", share.display_name, e.what());
    result = ConnectionStatus::offline(e.what());
  }

  {
    std::lock_guard lg(m_);
    if(task->token.is_cancelled()) {
      logger_->debug("Discarding result of cancelled refresh {} for {}", task->number, share.id);
      return;
    }
    statuses_[share.id] = result;
    auto it = refresh_tasks_.find(share.id);
    if(it != refresh_tasks_.end() && it->second == task) {
      refresh_tasks_.erase(it);
    }
  }
  notify(share.id, result);
}

void StatusTracker::set_status(const ConnectionStatus& status, const ShareId& id) {
  {
    std::lock_guard lg(m_);
    auto it = refresh_tasks_.find(id);
    if(it != refresh_tasks_.end()) {
      it->second->token.cancel();
      refresh_tasks_.erase(it);
    }
    statuses_[id] = status;
  }
  notify(id, status);
}

void StatusTracker::cancel_all_refreshes() {
  std::lock_guard lg(m_);
  for(auto& entry : refresh_tasks_) {
    entry.second->token.cancel();
  }
  if(!refresh_tasks_.empty()) {
    logger_->debug("Cancelled {} refresh(es)", refresh_tasks_.size());
  }
  refresh_tasks_.clear();
}

void StatusTracker::set_status_callback(StatusCallback cb) {
  std::lock_guard lg(callback_m_);
  status_callback_ = std::move(cb);
}

void StatusTracker::notify(const ShareId& id, const ConnectionStatus& status) {
  StatusCallback cb;
  {
    std::lock_guard lg(callback_m_);
    cb = status_callback_;
  }
  if(cb) cb(id, status);
}
