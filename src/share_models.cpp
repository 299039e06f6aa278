#include "share_models.hpp"
#include "utils.hpp"

const char* protocol_name(ShareProtocol protocol) {
  switch(protocol) {
    case ShareProtocol::Smb: return "SMB";
    case ShareProtocol::Nfs: return "NFS";
  }
  return "unknown";
}

DiscoveredShare DiscoveredShare::make(std::string host_name,
                                      std::string host_address,
                                      std::string share_name,
                                      std::optional<std::string> comment,
                                      bool is_manually_added) {
  DiscoveredShare share;
  share.id = make_share_id();
  share.host_name = std::move(host_name);
  share.host_address = std::move(host_address);
  share.share_name = std::move(share_name);
  share.comment = std::move(comment);
  share.discovered_at = std::chrono::system_clock::now();
  share.is_manually_added = is_manually_added;
  return share;
}

bool DiscoveredShare::operator==(const DiscoveredShare& other) const {
  return id == other.id &&
         host_name == other.host_name &&
         host_address == other.host_address &&
         share_name == other.share_name &&
         comment == other.comment &&
         discovered_at == other.discovered_at &&
         is_manually_added == other.is_manually_added;
}

bool same_share_target(const DiscoveredShare& a, const DiscoveredShare& b) {
  return a.host_address == b.host_address && a.share_name == b.share_name;
}

SavedShare SavedShare::make(std::string host_name,
                            std::string host_address,
                            std::string share_name,
                            std::optional<std::string> display_name,
                            std::optional<std::string> credential_id) {
  SavedShare share;
  share.id = make_share_id();
  share.display_name = display_name ? *display_name : host_name + "/" + share_name;
  share.host_name = std::move(host_name);
  share.host_address = std::move(host_address);
  share.share_name = std::move(share_name);
  share.credential_id = std::move(credential_id);
  share.saved_at = std::chrono::system_clock::now();
  return share;
}

SavedShare SavedShare::from_discovered(const DiscoveredShare& share,
                                       std::optional<std::string> credential_id,
                                       std::optional<std::string> display_name) {
  SavedShare saved;
  saved.id = share.id;
  saved.host_name = share.host_name;
  saved.host_address = share.host_address;
  saved.share_name = share.share_name;
  saved.display_name = display_name ? *display_name : share.display_name();
  saved.credential_id = std::move(credential_id);
  saved.saved_at = std::chrono::system_clock::now();
  return saved;
}

DiscoveredShare SavedShare::to_discovered_share() const {
  DiscoveredShare share;
  share.id = id;
  share.host_name = host_name;
  share.host_address = host_address;
  share.share_name = share_name;
  share.discovered_at = saved_at;
  share.is_manually_added = true;
  return share;
}

std::string ConnectionStatus::display_text() const {
  switch(state_) {
    case State::Unknown: return "Unknown";
    case State::Checking: return "Checking...";
    case State::Online: return "Online";
    case State::Offline: return "Offline: " + reason_;
  }
  return "Unknown";
}

const char* state_name(ConnectionStatus::State state) {
  switch(state) {
    case ConnectionStatus::State::Unknown: return "unknown";
    case ConnectionStatus::State::Checking: return "checking";
    case ConnectionStatus::State::Online: return "online";
    case ConnectionStatus::State::Offline: return "offline";
  }
  return "unknown";
}
