#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "share_models.hpp"

// ISO-8601 UTC, second precision.
std::string format_timestamp(const Timestamp& when);

nlohmann::json share_to_json(const DiscoveredShare& share);
nlohmann::json status_to_json(const ConnectionStatus& status);

// {"shares": [share + "status"], "summary": {"total", "online", "offline", "manual"}}
nlohmann::json build_share_report(const std::vector<DiscoveredShare>& shares,
                                  const std::unordered_map<ShareId, ConnectionStatus>& statuses);

// One line per share: "<display name>  <url>  <status>".
std::vector<std::string> format_share_lines(const std::vector<DiscoveredShare>& shares,
                                            const std::unordered_map<ShareId, ConnectionStatus>& statuses);
