#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include "command_line_parser.hpp"
#include "connection_status_checker.hpp"
#include "discovery_orchestrator.hpp"
#include "inventory_network.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "share_errors.hpp"
#include "share_report.hpp"
#include "status_tracker.hpp"

namespace {

// Blocks until the scan stops on its own, or until every inventory host has
// been queried and no enumeration is still running. Hosts are counted by
// address, the way a scan queries them.
void wait_for_scan(DiscoveryOrchestrator& orchestrator, std::size_t host_count) {
  struct Signal {
    std::mutex m;
    std::condition_variable cv;
  };
  // Shared so a callback copy still running on a worker outlives this frame.
  auto signal = std::make_shared<Signal>();
  orchestrator.set_change_callback([signal](){
    std::lock_guard lg(signal->m);
    signal->cv.notify_all();
  });

  auto done = [&](){
    if(!orchestrator.is_scanning()) return true;
    auto stats = orchestrator.stats();
    return stats.queried_hosts >= host_count && stats.enumerations_in_flight == 0;
  };

  std::unique_lock<std::mutex> lock(signal->m);
  // No change is reported for hosts without shares, so poll as well.
  while(!done()) {
    signal->cv.wait_for(lock, std::chrono::milliseconds(50));
  }
  lock.unlock();
  orchestrator.set_change_callback(nullptr);
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "sharewatch.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "sharewatch");
    try {
      parser.parse(argc, argv, settings);
    } catch(const CommandLineError& e) {
      print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("sharewatch");
    for(const auto& key : settings.keys()) {
      logger->debug("setting {} = {}", key, settings.value_as_string(key));
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    auto inventory_path = settings.get<std::string>("inventory");
    if(inventory_path.empty()) {
      print_err("No inventory given");
      parser.usage();
      return 1;
    }

    DiscoveryOrchestrator::Options options;
    options.scan_timeout = settings.milliseconds("scan_timeout_ms");
    options.connection_timeout = settings.milliseconds("connection_timeout_ms");

    auto network = std::make_shared<InventoryNetwork>(InventoryNetwork::load_inventory(inventory_path),
                                                      std::make_shared<Logger>("inventory"));
    DiscoveryOrchestrator orchestrator(network, network, network, options,
                                       std::make_shared<Logger>("discovery"));
    auto credentials = settings.credentials();

    orchestrator.start_discovery();
    wait_for_scan(orchestrator, network->distinct_address_count());
    orchestrator.stop_discovery();

    auto manual_host = settings.get<std::string>("manual_host");
    auto manual_share = settings.get<std::string>("manual_share");
    if(!manual_host.empty() || !manual_share.empty()) {
      try {
        auto added = orchestrator.add_manual_share({ShareProtocol::Smb, manual_host, manual_share, credentials});
        logger->info("Manual share {} validated", added.display_name());
      } catch(const ConnectionError& e) {
        logger->error("Could not add {}/{}: {}", manual_host, manual_share, e.what());
      }
    }

    auto shares = orchestrator.all_shares();
    auto checker = std::make_shared<ConnectionStatusChecker>(network, options.connection_timeout,
                                                             std::make_shared<Logger>("status-checker"));
    StatusTracker tracker(checker, std::make_shared<Logger>("status"));

    std::vector<StatusTracker::RefreshRequest> requests;
    requests.reserve(shares.size());
    for(const auto& share : shares) {
      tracker.start_tracking(share.id);
      requests.emplace_back(SavedShare::from_discovered(share), credentials);
    }
    tracker.refresh_all_statuses(requests);

    auto statuses = tracker.statuses();
    if(settings.get<bool>("json")) {
      logger->print("{}", build_share_report(shares, statuses).dump(2));
    } else if(shares.empty()) {
      logger->print("No shares found");
    } else {
      for(const auto& line : format_share_lines(shares, statuses)) {
        logger->print("{}", line);
      }
    }
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("sharewatch-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
