#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "capabilities.hpp"
#include "log.hpp"

constexpr std::chrono::milliseconds kDefaultConnectionTimeout{10000};
constexpr std::size_t kDefaultMaxPendingAttempts = 8;

bool is_valid_host(const std::string& host);
bool is_valid_share_name(const std::string& share_name);

// First of "work finishes" or "timeout elapses" wins. On timeout the work's
// token is cancelled, its eventual result is discarded and on_timeout()'s
// result (or exception) is returned. A non-positive timeout runs inline.
template<typename T, typename Work, typename OnTimeout>
T run_with_timeout(Work work, std::chrono::milliseconds timeout, OnTimeout on_timeout) {
  CancellationToken token;
  if(timeout.count() <= 0) {
    return work(token);
  }

  auto promise = std::make_shared<std::promise<T>>();
  auto result = promise->get_future();
  std::thread([promise, token, work = std::move(work)]() mutable {
    try {
      promise->set_value(work(token));
    } catch(...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if(result.wait_for(timeout) == std::future_status::timeout) {
    token.cancel();
    return on_timeout();
  }
  return result.get();
}

// Validates host and share name, then races the wrapped tester against the
// connection timeout. A timed-out attempt keeps its thread until the backend
// returns; once max_pending of those are still running, further calls fail
// with a timeout straight away instead of starting another thread.
class GuardedConnectionTester : public ConnectionTester {
public:
  GuardedConnectionTester(std::shared_ptr<ConnectionTester> inner,
                          std::chrono::milliseconds timeout = kDefaultConnectionTimeout,
                          std::shared_ptr<Logger> logger = nullptr,
                          std::size_t max_pending = kDefaultMaxPendingAttempts);

  DiscoveredShare test_connection(const std::string& host,
                                  const std::string& share_name,
                                  const std::optional<ShareCredentials>& credentials) override;

  std::chrono::milliseconds timeout() const { return timeout_; }
  // Timed-out attempts whose thread is still inside the wrapped tester.
  std::size_t hanging_attempts() const { return hanging_->load(); }

private:
  std::shared_ptr<ConnectionTester> inner_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
  std::size_t max_pending_;
  // Shared with attempt threads, which may outlive this object.
  std::shared_ptr<std::atomic<std::size_t>> hanging_ = std::make_shared<std::atomic<std::size_t>>(0);
};
