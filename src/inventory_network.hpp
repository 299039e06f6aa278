#pragma once
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "capabilities.hpp"
#include "log.hpp"

// Offline network described by a JSON inventory:
//
//   {"hosts": [{"name": "NAS1", "address": "10.0.0.5",
//               "announce_delay_ms": 0, "reachable": true,
//               "credentials": {"username": "u", "password": "p"},
//               "shares": ["Movies", {"name": "Music", "comment": "FLAC"}]}]}
//
// Serves as host discoverer, share enumerator and connection tester at once.
class InventoryNetwork : public HostDiscoverer,
                         public ShareEnumerator,
                         public ConnectionTester {
public:
  struct ShareEntry {
    std::string name;
    std::optional<std::string> comment;
  };

  struct HostEntry {
    DiscoveredHost host;
    std::vector<ShareEntry> shares;
    bool reachable = true;
    // When set, connections must present exactly these credentials.
    std::optional<ShareCredentials> credentials;
    std::chrono::milliseconds announce_delay{0};
  };

  explicit InventoryNetwork(std::vector<HostEntry> hosts,
                            std::shared_ptr<Logger> logger = nullptr);
  ~InventoryNetwork() override;

  // Throws std::runtime_error on malformed input.
  static std::vector<HostEntry> parse_inventory(const nlohmann::json& doc);
  static std::vector<HostEntry> load_inventory(const std::filesystem::path& path);

  std::shared_ptr<HostStream> discover_hosts() override;
  void stop_discovery() override;

  std::vector<DiscoveredShare> list_shares(const DiscoveredHost& host) override;

  DiscoveredShare test_connection(const std::string& host,
                                  const std::string& share_name,
                                  const std::optional<ShareCredentials>& credentials) override;

  std::size_t host_count() const { return hosts_.size(); }
  // Entries sharing an address are one host to a scan.
  std::size_t distinct_address_count() const;

private:
  const HostEntry* find_by_address(const std::string& address) const;
  const HostEntry* find_by_name_or_address(const std::string& host) const;
  void announce(std::shared_ptr<HostStream> stream);

  const std::vector<HostEntry> hosts_;
  std::shared_ptr<Logger> logger_;

  std::mutex m_;
  std::condition_variable stop_cv_;
  bool stop_requested_ = false;
  std::shared_ptr<HostStream> stream_;
  std::thread announcer_;
};
