#include "inventory_network.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

#include "share_errors.hpp"
#include "utils.hpp"

InventoryNetwork::InventoryNetwork(std::vector<HostEntry> hosts, std::shared_ptr<Logger> logger)
  : hosts_(std::move(hosts)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("inventory")) {}

InventoryNetwork::~InventoryNetwork() {
  stop_discovery();
}

std::vector<InventoryNetwork::HostEntry> InventoryNetwork::parse_inventory(const nlohmann::json& doc) {
  if(!doc.is_object() || !doc.contains("hosts") || !doc.at("hosts").is_array()) {
    throw std::runtime_error("inventory must be an object with a \"hosts\" array");
  }
  std::vector<HostEntry> result;
  for(const auto& item : doc.at("hosts")) {
    HostEntry entry;
    try {
      entry.host.address = item.at("address").get<std::string>();
      entry.host.name = item.value("name", entry.host.address);
      entry.reachable = item.value("reachable", true);
      entry.announce_delay = std::chrono::milliseconds(item.value("announce_delay_ms", 0));
      if(item.contains("credentials")) {
        const auto& creds = item.at("credentials");
        entry.credentials = ShareCredentials{creds.at("username").get<std::string>(),
                                             creds.value("password", "")};
      }
      for(const auto& share : item.value("shares", nlohmann::json::array())) {
        ShareEntry share_entry;
        if(share.is_string()) {
          share_entry.name = share.get<std::string>();
        } else {
          share_entry.name = share.at("name").get<std::string>();
          auto comment = share.value("comment", "");
          if(!comment.empty()) share_entry.comment = comment;
        }
        entry.shares.push_back(std::move(share_entry));
      }
    } catch(const nlohmann::json::exception& e) {
      throw std::runtime_error("invalid inventory host entry: " + std::string(e.what()));
    }
    if(trim_copy(entry.host.address).empty()) {
      throw std::runtime_error("inventory host entry has an empty address");
    }
    result.push_back(std::move(entry));
  }
  return result;
}

std::vector<InventoryNetwork::HostEntry> InventoryNetwork::load_inventory(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) {
    throw std::runtime_error("unable to open inventory " + path.string());
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("failed to parse " + path.string() + ": " + e.what());
  }
  return parse_inventory(doc);
}

std::shared_ptr<HostStream> InventoryNetwork::discover_hosts() {
  stop_discovery();
  auto stream = std::make_shared<HostStream>();
  std::lock_guard lg(m_);
  stop_requested_ = false;
  stream_ = stream;
  announcer_ = std::thread(&InventoryNetwork::announce, this, stream);
  return stream;
}

void InventoryNetwork::announce(std::shared_ptr<HostStream> stream) {
  for(const auto& entry : hosts_) {
    {
      std::unique_lock<std::mutex> lock(m_);
      if(stop_cv_.wait_for(lock, entry.announce_delay, [this]{ return stop_requested_; })) {
        return;
      }
    }
    logger_->debug("Announcing {} ({})", entry.host.name, entry.host.address);
    stream->push(entry.host);
  }
}

void InventoryNetwork::stop_discovery() {
  std::thread announcer;
  std::shared_ptr<HostStream> stream;
  {
    std::lock_guard lg(m_);
    stop_requested_ = true;
    announcer.swap(announcer_);
    stream.swap(stream_);
  }
  stop_cv_.notify_all();
  if(stream) stream->close();
  if(announcer.joinable()) announcer.join();
}

const InventoryNetwork::HostEntry* InventoryNetwork::find_by_address(const std::string& address) const {
  for(const auto& entry : hosts_) {
    if(entry.host.address == address) return &entry;
  }
  return nullptr;
}

const InventoryNetwork::HostEntry* InventoryNetwork::find_by_name_or_address(const std::string& host) const {
  if(const auto* entry = find_by_address(host)) return entry;
  auto lowered = to_lower_copy(host);
  for(const auto& entry : hosts_) {
    if(to_lower_copy(entry.host.name) == lowered) return &entry;
  }
  return nullptr;
}

std::vector<DiscoveredShare> InventoryNetwork::list_shares(const DiscoveredHost& host) {
  const auto* entry = find_by_address(host.address);
  if(!entry) {
    throw DiscoveryError::invalid_host();
  }
  if(!entry->reachable) {
    throw DiscoveryError::connection_failed(host.address + " is not responding");
  }
  std::vector<DiscoveredShare> shares;
  shares.reserve(entry->shares.size());
  for(const auto& share : entry->shares) {
    shares.push_back(DiscoveredShare::make(host.name, host.address, share.name, share.comment));
  }
  return filter_administrative_shares(std::move(shares));
}

DiscoveredShare InventoryNetwork::test_connection(const std::string& host,
                                                  const std::string& share_name,
                                                  const std::optional<ShareCredentials>& credentials) {
  const auto* entry = find_by_name_or_address(host);
  if(!entry || !entry->reachable) {
    throw ConnectionError::host_unreachable(host);
  }
  if(entry->credentials) {
    auto presented = credentials ? *credentials : ShareCredentials::guest();
    if(!(presented == *entry->credentials)) {
      throw ConnectionError::authentication_failed();
    }
  }
  for(const auto& share : entry->shares) {
    if(share.name == share_name) {
      return DiscoveredShare::make(entry->host.name, entry->host.address, share.name, share.comment, true);
    }
  }
  throw ConnectionError::share_not_found(share_name);
}

std::size_t InventoryNetwork::distinct_address_count() const {
  std::set<std::string> addresses;
  for(const auto& entry : hosts_) {
    addresses.insert(entry.host.address);
  }
  return addresses.size();
}
