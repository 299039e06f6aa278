#include "connection_status_checker.hpp"

#include "share_errors.hpp"

ConnectionStatusChecker::ConnectionStatusChecker(std::shared_ptr<ConnectionTester> tester,
                                                 std::chrono::milliseconds timeout,
                                                 std::shared_ptr<Logger> logger)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("status-checker")),
    tester_(std::move(tester), timeout, logger_) {}

ConnectionStatus ConnectionStatusChecker::check_status(const SavedShare& share,
                                                       const std::optional<ShareCredentials>& credentials) {
  try {
    tester_.test_connection(share.host_address, share.share_name, credentials);
    return ConnectionStatus::online();
  } catch(const ConnectionError& e) {
    logger_->debug("{} offline ({}): {}", share.display_name, kind_name(e.kind()), e.what());
    return ConnectionStatus::offline(e.what());
  } catch(const std::exception& e) {
    logger_->debug("{} offline: {}", share.display_name, e.what());
    return ConnectionStatus::offline(e.what());
  }
}
