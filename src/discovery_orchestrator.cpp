#include "discovery_orchestrator.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>

#include "share_errors.hpp"
#include "utils.hpp"

struct DiscoveryOrchestrator::ScanSession {
  std::uint64_t number = 0;
  CancellationToken token;
  std::shared_ptr<asio::steady_timer> timer; // touched on the io thread only
  std::atomic<std::size_t> active_tasks{0};
  std::atomic<std::size_t> enumerations_in_flight{0};

  mutable std::mutex m;
  std::shared_ptr<HostStream> stream;
  std::vector<DiscoveredShare> shares;
  std::unordered_set<std::string> queried_hosts;
  std::vector<std::thread> workers;
};

namespace {

void sort_by_display_name(std::vector<DiscoveredShare>& shares) {
  std::stable_sort(shares.begin(), shares.end(),
                   [](const DiscoveredShare& a, const DiscoveredShare& b){
                     return less_case_insensitive(a.display_name(), b.display_name());
                   });
}

bool contains_target(const std::vector<DiscoveredShare>& shares, const DiscoveredShare& share) {
  return std::any_of(shares.begin(), shares.end(),
                     [&](const DiscoveredShare& existing){ return same_share_target(existing, share); });
}

} // namespace

DiscoveryOrchestrator::DiscoveryOrchestrator(std::shared_ptr<HostDiscoverer> host_discoverer,
                                             std::shared_ptr<ShareEnumerator> share_enumerator,
                                             std::shared_ptr<ConnectionTester> connection_tester,
                                             Options options,
                                             std::shared_ptr<Logger> logger)
  : work_(asio::make_work_guard(io_)),
    options_(options),
    host_discoverer_(std::move(host_discoverer)),
    share_enumerator_(std::move(share_enumerator)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {
  if(!host_discoverer_ || !share_enumerator_ || !connection_tester) {
    throw std::invalid_argument("DiscoveryOrchestrator requires a host discoverer, share enumerator and connection tester");
  }
  if(options_.scan_timeout.count() <= 0) {
    options_.scan_timeout = Options{}.scan_timeout;
  }
  connection_tester_ = std::make_shared<GuardedConnectionTester>(std::move(connection_tester),
                                                                 options_.connection_timeout,
                                                                 logger_);
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

DiscoveryOrchestrator::~DiscoveryOrchestrator() {
  stop_discovery();
  // Every timer is cancelled by now, so run() returns once the queue drains.
  work_.reset();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  reap_retired_sessions(true);
  std::lock_guard lg(state_m_);
  last_session_.reset();
}

void DiscoveryOrchestrator::start_discovery() {
  std::unique_lock lifecycle(lifecycle_m_);
  auto session = std::make_shared<ScanSession>();
  {
    std::lock_guard lg(state_m_);
    if(scanning_) return;
    session->number = ++session_counter_;
    scanning_ = true;
    current_session_ = session;
    last_session_ = session;
  }
  reap_retired_sessions(false);
  logger_->info("Scan {} started (timeout {} ms)", session->number, options_.scan_timeout.count());

  std::shared_ptr<HostStream> stream;
  try {
    stream = host_discoverer_->discover_hosts();
    if(!stream) {
      throw std::runtime_error("host discoverer returned no stream");
    }
  } catch(const std::exception& e) {
    logger_->error("Scan {} could not start host discovery: {}", session->number, e.what());
    std::size_t found = 0;
    bool retired = retire_session(session, found);
    lifecycle.unlock();
    if(retired) {
      logger_->info("Scan {} failed with {} share(s)", session->number, found);
      notify_changed();
    }
    throw;
  }

  {
    std::lock_guard lg(session->m);
    session->stream = stream;
    ++session->active_tasks;
    session->workers.emplace_back(&DiscoveryOrchestrator::run_host_loop, this, session, stream);
  }
  arm_scan_timer(session);
  lifecycle.unlock();
  notify_changed();
}

void DiscoveryOrchestrator::stop_discovery() {
  std::shared_ptr<ScanSession> session;
  {
    std::lock_guard lg(state_m_);
    session = current_session_;
  }
  if(session) {
    end_session(session, "stopped");
  }
}

void DiscoveryOrchestrator::rescan() {
  stop_discovery();
  start_discovery();
}

void DiscoveryOrchestrator::run_host_loop(std::shared_ptr<ScanSession> session,
                                          std::shared_ptr<HostStream> stream) {
  while(auto host = stream->next()) {
    if(session->token.is_cancelled()) break;
    dispatch_enumeration(session, *host);
  }
  logger_->debug("Scan {} host stream finished", session->number);
  --session->active_tasks;
}

void DiscoveryOrchestrator::dispatch_enumeration(const std::shared_ptr<ScanSession>& session,
                                                 const DiscoveredHost& host) {
  std::lock_guard lg(session->m);
  if(session->token.is_cancelled()) return;
  if(!session->queried_hosts.insert(host.address).second) {
    logger_->debug("Scan {} ignoring repeated host {} ({})", session->number, host.name, host.address);
    return;
  }
  logger_->debug("Scan {} enumerating shares on {} ({})", session->number, host.name, host.address);
  ++session->active_tasks;
  ++session->enumerations_in_flight;
  try {
    session->workers.emplace_back(&DiscoveryOrchestrator::enumerate_host, this, session, host);
  } catch(const std::system_error& e) {
    --session->enumerations_in_flight;
    --session->active_tasks;
    logger_->error("Unable to start share enumeration for {}: {}", host.address, e.what());
  }
}

void DiscoveryOrchestrator::enumerate_host(std::shared_ptr<ScanSession> session, DiscoveredHost host) {
  std::size_t added = 0;
  try {
    auto found = share_enumerator_->list_shares(host);
    added = merge_shares(*session, found);
  } catch(const DiscoveryError& e) {
    logger_->warn("Failed to enumerate shares on {} ({}): {}", host.name, host.address, e.what());
  } catch(const std::exception& e) {
    logger_->warn("Failed to enumerate shares on {} ({}): {}", host.name, host.address, e.what());
  }
  --session->enumerations_in_flight;
  if(added > 0) {
    notify_changed();
  }
  --session->active_tasks;
}

std::size_t DiscoveryOrchestrator::merge_shares(ScanSession& session,
                                                const std::vector<DiscoveredShare>& found) {
  std::lock_guard lg(session.m);
  if(session.token.is_cancelled()) return 0;
  std::size_t added = 0;
  for(const auto& share : found) {
    if(contains_target(session.shares, share)) continue;
    session.shares.push_back(share);
    ++added;
  }
  return added;
}

void DiscoveryOrchestrator::arm_scan_timer(const std::shared_ptr<ScanSession>& session) {
  auto timeout = options_.scan_timeout;
  asio::post(io_, [this, session, timeout](){
    if(session->token.is_cancelled()) return;
    session->timer = std::make_shared<asio::steady_timer>(io_, timeout);
    session->timer->async_wait([this, session](const std::error_code& ec){
      if(ec) return;
      if(end_session(session, "timeout")) {
        logger_->info("Scan {} hit its {} ms timeout", session->number, options_.scan_timeout.count());
      }
    });
  });
}

bool DiscoveryOrchestrator::end_session(const std::shared_ptr<ScanSession>& session, const char* reason) {
  std::size_t found = 0;
  {
    std::lock_guard lifecycle(lifecycle_m_);
    if(!retire_session(session, found)) return false;
  }
  logger_->info("Scan {} {} with {} share(s)", session->number, reason, found);
  notify_changed();
  return true;
}

bool DiscoveryOrchestrator::retire_session(const std::shared_ptr<ScanSession>& session, std::size_t& found) {
  {
    std::lock_guard lg(state_m_);
    if(session != current_session_ || !scanning_) return false;
    scanning_ = false;
    current_session_.reset();
    retired_sessions_.push_back(session);
    session->token.cancel();
  }

  std::shared_ptr<HostStream> stream;
  {
    std::lock_guard lg(session->m);
    stream = session->stream;
    found = session->shares.size();
  }
  if(stream) {
    stream->close();
  }
  asio::post(io_, [session](){
    if(session->timer) {
      session->timer->cancel();
    }
  });
  host_discoverer_->stop_discovery();
  return true;
}

void DiscoveryOrchestrator::reap_retired_sessions(bool wait_all) {
  std::vector<std::shared_ptr<ScanSession>> finished;
  {
    std::lock_guard lg(state_m_);
    auto split = std::stable_partition(retired_sessions_.begin(), retired_sessions_.end(),
      [wait_all](const std::shared_ptr<ScanSession>& session){
        return !wait_all && session->active_tasks.load() > 0;
      });
    finished.assign(split, retired_sessions_.end());
    retired_sessions_.erase(split, retired_sessions_.end());
  }
  for(auto& session : finished) {
    std::vector<std::thread> workers;
    {
      std::lock_guard lg(session->m);
      workers.swap(session->workers);
    }
    for(auto& worker : workers) {
      if(worker.joinable()) worker.join();
    }
  }
}

DiscoveredShare DiscoveryOrchestrator::add_manual_share(const ManualShareInput& input) {
  if(input.protocol != ShareProtocol::Smb) {
    throw ConnectionError::unsupported_protocol(input.protocol);
  }

  auto validated = connection_tester_->test_connection(input.host, input.share_name, input.credentials);
  validated.is_manually_added = true;

  std::shared_ptr<ScanSession> session;
  {
    std::lock_guard lg(state_m_);
    session = last_session_;
  }
  bool added = false;
  {
    // manual_m_ before session->m; merge_shares only ever takes the latter.
    std::lock_guard manual_lock(manual_m_);
    std::unique_lock<std::mutex> session_lock;
    if(session) {
      session_lock = std::unique_lock<std::mutex>(session->m);
    }
    bool known = contains_target(manual_shares_, validated) ||
                 (session && contains_target(session->shares, validated));
    if(!known) {
      manual_shares_.push_back(validated);
      added = true;
    }
  }

  if(added) {
    logger_->info("Added manual share {}", validated.display_name());
    notify_changed();
  } else {
    logger_->debug("Manual share {} is already known", validated.display_name());
  }
  return validated;
}

void DiscoveryOrchestrator::remove_manual_share(const DiscoveredShare& share) {
  bool removed = false;
  {
    std::lock_guard lg(manual_m_);
    auto it = std::remove_if(manual_shares_.begin(), manual_shares_.end(),
                             [&](const DiscoveredShare& existing){ return existing.id == share.id; });
    removed = it != manual_shares_.end();
    manual_shares_.erase(it, manual_shares_.end());
  }
  if(removed) {
    logger_->info("Removed manual share {}", share.display_name());
    notify_changed();
  }
}

std::vector<DiscoveredShare> DiscoveryOrchestrator::shares() const {
  std::shared_ptr<ScanSession> session;
  {
    std::lock_guard lg(state_m_);
    session = last_session_;
  }
  if(!session) return {};
  std::lock_guard lg(session->m);
  return session->shares;
}

std::vector<DiscoveredShare> DiscoveryOrchestrator::manual_shares() const {
  std::lock_guard lg(manual_m_);
  return manual_shares_;
}

std::vector<DiscoveredShare> DiscoveryOrchestrator::all_shares() const {
  auto manual = manual_shares();
  auto discovered = shares();
  sort_by_display_name(manual);
  sort_by_display_name(discovered);
  manual.insert(manual.end(), discovered.begin(), discovered.end());
  return manual;
}

bool DiscoveryOrchestrator::is_scanning() const {
  std::lock_guard lg(state_m_);
  return scanning_;
}

DiscoveryOrchestrator::Stats DiscoveryOrchestrator::stats() const {
  Stats s;
  std::shared_ptr<ScanSession> session;
  {
    std::lock_guard lg(state_m_);
    s.scans_started = session_counter_;
    session = last_session_;
  }
  if(session) {
    std::lock_guard lg(session->m);
    s.queried_hosts = session->queried_hosts.size();
    s.discovered_shares = session->shares.size();
    s.enumerations_in_flight = session->enumerations_in_flight.load();
  }
  {
    std::lock_guard lg(manual_m_);
    s.manual_shares = manual_shares_.size();
  }
  return s;
}

void DiscoveryOrchestrator::set_change_callback(ChangeCallback cb) {
  std::lock_guard lg(callback_m_);
  change_callback_ = std::move(cb);
}

void DiscoveryOrchestrator::notify_changed() {
  ChangeCallback cb;
  {
    std::lock_guard lg(callback_m_);
    cb = change_callback_;
  }
  if(cb) cb();
}
