#pragma once
#include <chrono>
#include <optional>
#include <string>

using ShareId = std::string;
using Timestamp = std::chrono::system_clock::time_point;

// A host advertising the share service. Identity is the address.
struct DiscoveredHost {
  std::string name;
  std::string address;

  bool operator==(const DiscoveredHost& other) const {
    return name == other.name && address == other.address;
  }
};

struct ShareCredentials {
  std::string username;
  std::string password;

  static ShareCredentials guest() { return {"guest", "guest"}; }

  bool operator==(const ShareCredentials& other) const {
    return username == other.username && password == other.password;
  }
};

enum class ShareProtocol { Smb, Nfs };

const char* protocol_name(ShareProtocol protocol);

struct DiscoveredShare {
  ShareId id;
  std::string host_name;
  std::string host_address;
  std::string share_name;
  std::optional<std::string> comment;
  Timestamp discovered_at;
  bool is_manually_added = false;

  // Fresh id, discovered now.
  static DiscoveredShare make(std::string host_name,
                              std::string host_address,
                              std::string share_name,
                              std::optional<std::string> comment = std::nullopt,
                              bool is_manually_added = false);

  std::string display_name() const { return host_name + "/" + share_name; }
  std::string connection_url() const { return "smb://" + host_address + "/" + share_name; }

  bool operator==(const DiscoveredShare& other) const;
};

// Dedup identity: (host_address, share_name), exact match.
bool same_share_target(const DiscoveredShare& a, const DiscoveredShare& b);

struct SavedShare {
  ShareId id;
  std::string host_name;
  std::string host_address;
  std::string share_name;
  std::string display_name;
  std::optional<std::string> credential_id;
  Timestamp saved_at;

  static SavedShare make(std::string host_name,
                         std::string host_address,
                         std::string share_name,
                         std::optional<std::string> display_name = std::nullopt,
                         std::optional<std::string> credential_id = std::nullopt);

  // Keeps the discovered share's id.
  static SavedShare from_discovered(const DiscoveredShare& share,
                                    std::optional<std::string> credential_id = std::nullopt,
                                    std::optional<std::string> display_name = std::nullopt);

  DiscoveredShare to_discovered_share() const;
  std::string connection_url() const { return "smb://" + host_address + "/" + share_name; }
};

struct ManualShareInput {
  ShareProtocol protocol = ShareProtocol::Smb;
  std::string host;
  std::string share_name;
  std::optional<ShareCredentials> credentials;
};

class ConnectionStatus {
public:
  enum class State { Unknown, Checking, Online, Offline };

  ConnectionStatus() = default;

  static ConnectionStatus unknown() { return ConnectionStatus(State::Unknown, {}); }
  static ConnectionStatus checking() { return ConnectionStatus(State::Checking, {}); }
  static ConnectionStatus online() { return ConnectionStatus(State::Online, {}); }
  static ConnectionStatus offline(std::string reason) {
    return ConnectionStatus(State::Offline, std::move(reason));
  }

  State state() const { return state_; }
  // Empty unless offline.
  const std::string& reason() const { return reason_; }

  bool is_online() const { return state_ == State::Online; }
  bool is_checking() const { return state_ == State::Checking; }
  std::string display_text() const;

  bool operator==(const ConnectionStatus& other) const {
    return state_ == other.state_ && reason_ == other.reason_;
  }
  bool operator!=(const ConnectionStatus& other) const { return !(*this == other); }

private:
  ConnectionStatus(State state, std::string reason)
    : state_(state), reason_(std::move(reason)) {}

  State state_ = State::Unknown;
  std::string reason_;
};

const char* state_name(ConnectionStatus::State state);
