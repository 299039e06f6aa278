#include "connection_guard.hpp"

#include <asio.hpp>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include "share_errors.hpp"
#include "utils.hpp"

namespace {

bool looks_like_ip_literal(const std::string& host) {
  if(host.find(':') != std::string::npos) return true;
  return std::all_of(host.begin(), host.end(),
                     [](unsigned char ch){ return std::isdigit(ch) || ch == '.'; });
}

} // namespace

bool is_valid_host(const std::string& host) {
  auto trimmed = trim_copy(host);
  if(trimmed.empty()) return false;
  if(std::any_of(trimmed.begin(), trimmed.end(),
                 [](unsigned char ch){ return std::isspace(ch); })) {
    return false;
  }
  if(looks_like_ip_literal(trimmed)) {
    std::error_code ec;
    asio::ip::make_address(trimmed, ec);
    return !ec;
  }
  return true;
}

bool is_valid_share_name(const std::string& share_name) {
  auto trimmed = trim_copy(share_name);
  return !trimmed.empty() && trimmed.front() != '/' && trimmed.back() != '/';
}

GuardedConnectionTester::GuardedConnectionTester(std::shared_ptr<ConnectionTester> inner,
                                                 std::chrono::milliseconds timeout,
                                                 std::shared_ptr<Logger> logger,
                                                 std::size_t max_pending)
  : inner_(std::move(inner)),
    timeout_(timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("connection")),
    max_pending_(max_pending == 0 ? 1 : max_pending) {
  if(!inner_) {
    throw std::invalid_argument("GuardedConnectionTester requires a connection tester");
  }
}

DiscoveredShare GuardedConnectionTester::test_connection(const std::string& host,
                                                         const std::string& share_name,
                                                         const std::optional<ShareCredentials>& credentials) {
  if(!is_valid_host(host)) {
    throw ConnectionError::invalid_hostname();
  }
  if(!is_valid_share_name(share_name)) {
    throw ConnectionError::invalid_share_path();
  }

  auto clean_host = trim_copy(host);
  auto clean_share = trim_copy(share_name);
  if(timeout_.count() > 0 && hanging_->load() >= max_pending_) {
    logger_->warn("Connection to {}/{} refused: {} earlier attempts still hanging",
                  clean_host, clean_share, hanging_->load());
    throw ConnectionError::connection_timeout();
  }

  // finished and abandoned are settled under m, so each attempt adds to and
  // removes from hanging_ at most once.
  struct Attempt {
    std::mutex m;
    bool finished = false;
    bool abandoned = false;
  };
  auto attempt = std::make_shared<Attempt>();
  auto hanging = hanging_;
  auto inner = inner_;
  return run_with_timeout<DiscoveredShare>(
    [inner, attempt, hanging, clean_host, clean_share, credentials](const CancellationToken&) {
      struct Finish {
        Attempt& attempt;
        std::atomic<std::size_t>& hanging;
        ~Finish() {
          std::lock_guard lg(attempt.m);
          attempt.finished = true;
          if(attempt.abandoned) --hanging;
        }
      } finish{*attempt, *hanging};
      return inner->test_connection(clean_host, clean_share, credentials);
    },
    timeout_,
    [&]() -> DiscoveredShare {
      {
        std::lock_guard lg(attempt->m);
        if(!attempt->finished) {
          attempt->abandoned = true;
          ++*hanging;
        }
      }
      logger_->warn("Connection to {}/{} timed out after {} ms",
                    clean_host, clean_share, timeout_.count());
      throw ConnectionError::connection_timeout();
    });
}
