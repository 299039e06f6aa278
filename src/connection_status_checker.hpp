#pragma once
#include <chrono>
#include <memory>

#include "capabilities.hpp"
#include "connection_guard.hpp"
#include "log.hpp"

// StatusChecker built on a ConnectionTester: a successful connection is
// Online, any failure is Offline with the error's description.
class ConnectionStatusChecker : public StatusChecker {
public:
  explicit ConnectionStatusChecker(std::shared_ptr<ConnectionTester> tester,
                                   std::chrono::milliseconds timeout = kDefaultConnectionTimeout,
                                   std::shared_ptr<Logger> logger = nullptr);

  ConnectionStatus check_status(const SavedShare& share,
                                const std::optional<ShareCredentials>& credentials) override;

private:
  std::shared_ptr<Logger> logger_;
  GuardedConnectionTester tester_;
};
