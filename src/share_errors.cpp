#include "share_errors.hpp"

DiscoveryError::DiscoveryError(Kind kind, const std::string& message, std::string detail)
  : std::runtime_error(message), kind_(kind), detail_(std::move(detail)) {}

DiscoveryError DiscoveryError::invalid_host() {
  return DiscoveryError(Kind::InvalidHost, "Invalid host", {});
}

DiscoveryError DiscoveryError::timeout() {
  return DiscoveryError(Kind::Timeout, "Share enumeration timed out", {});
}

DiscoveryError DiscoveryError::network_unavailable() {
  return DiscoveryError(Kind::NetworkUnavailable, "Network unavailable", {});
}

DiscoveryError DiscoveryError::connection_failed(std::string detail) {
  std::string message = "Connection failed: " + detail;
  return DiscoveryError(Kind::ConnectionFailed, message, std::move(detail));
}

ConnectionError::ConnectionError(Kind kind, const std::string& message)
  : std::runtime_error(message), kind_(kind) {}

ConnectionError ConnectionError::invalid_hostname() {
  return ConnectionError(Kind::InvalidHostname, "Invalid hostname or IP address");
}

ConnectionError ConnectionError::invalid_share_path() {
  return ConnectionError(Kind::InvalidSharePath, "Invalid share path");
}

ConnectionError ConnectionError::host_unreachable(std::string host) {
  ConnectionError error(Kind::HostUnreachable, "Cannot reach host: " + host);
  error.host_ = std::move(host);
  return error;
}

ConnectionError ConnectionError::authentication_failed() {
  return ConnectionError(Kind::AuthenticationFailed,
                         "Authentication failed. Please check your username and password.");
}

ConnectionError ConnectionError::share_not_found(std::string share_name) {
  ConnectionError error(Kind::ShareNotFound, "Share not found: " + share_name);
  error.share_name_ = std::move(share_name);
  return error;
}

ConnectionError ConnectionError::connection_timeout() {
  return ConnectionError(Kind::ConnectionTimeout, "Connection timed out");
}

ConnectionError ConnectionError::unsupported_protocol(ShareProtocol protocol) {
  ConnectionError error(Kind::UnsupportedProtocol,
                        std::string(protocol_name(protocol)) + " is not yet supported");
  error.protocol_ = protocol;
  return error;
}

const char* kind_name(ConnectionError::Kind kind) {
  switch(kind) {
    case ConnectionError::Kind::InvalidHostname: return "invalid_hostname";
    case ConnectionError::Kind::InvalidSharePath: return "invalid_share_path";
    case ConnectionError::Kind::HostUnreachable: return "host_unreachable";
    case ConnectionError::Kind::AuthenticationFailed: return "authentication_failed";
    case ConnectionError::Kind::ShareNotFound: return "share_not_found";
    case ConnectionError::Kind::ConnectionTimeout: return "connection_timeout";
    case ConnectionError::Kind::UnsupportedProtocol: return "unsupported_protocol";
  }
  return "unknown";
}
