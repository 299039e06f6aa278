#pragma once
#include <stdexcept>
#include <string>

#include "share_models.hpp"

// Raised by a ShareEnumerator for one host. Never reaches the caller of a scan.
class DiscoveryError : public std::runtime_error {
public:
  enum class Kind { InvalidHost, Timeout, NetworkUnavailable, ConnectionFailed };

  static DiscoveryError invalid_host();
  static DiscoveryError timeout();
  static DiscoveryError network_unavailable();
  static DiscoveryError connection_failed(std::string detail);

  Kind kind() const { return kind_; }
  const std::string& detail() const { return detail_; }

private:
  DiscoveryError(Kind kind, const std::string& message, std::string detail);

  Kind kind_;
  std::string detail_;
};

// Raised by connection testing and manual share validation.
class ConnectionError : public std::runtime_error {
public:
  enum class Kind {
    InvalidHostname,
    InvalidSharePath,
    HostUnreachable,
    AuthenticationFailed,
    ShareNotFound,
    ConnectionTimeout,
    UnsupportedProtocol
  };

  static ConnectionError invalid_hostname();
  static ConnectionError invalid_share_path();
  static ConnectionError host_unreachable(std::string host);
  static ConnectionError authentication_failed();
  static ConnectionError share_not_found(std::string share_name);
  static ConnectionError connection_timeout();
  static ConnectionError unsupported_protocol(ShareProtocol protocol);

  Kind kind() const { return kind_; }
  const std::string& host() const { return host_; }
  const std::string& share_name() const { return share_name_; }
  ShareProtocol protocol() const { return protocol_; }

private:
  ConnectionError(Kind kind, const std::string& message);

  Kind kind_;
  std::string host_;
  std::string share_name_;
  ShareProtocol protocol_ = ShareProtocol::Smb;
};

const char* kind_name(ConnectionError::Kind kind);
