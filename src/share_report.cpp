#include "share_report.hpp"

#include <algorithm>
#include <ctime>

#include <spdlog/fmt/fmt.h>

namespace {

ConnectionStatus lookup(const std::unordered_map<ShareId, ConnectionStatus>& statuses, const ShareId& id) {
  auto it = statuses.find(id);
  return it == statuses.end() ? ConnectionStatus::unknown() : it->second;
}

} // namespace

std::string format_timestamp(const Timestamp& when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

nlohmann::json share_to_json(const DiscoveredShare& share) {
  nlohmann::json doc = {
    {"id", share.id},
    {"host_name", share.host_name},
    {"host_address", share.host_address},
    {"share_name", share.share_name},
    {"display_name", share.display_name()},
    {"url", share.connection_url()},
    {"discovered_at", format_timestamp(share.discovered_at)},
    {"manual", share.is_manually_added}
  };
  doc["comment"] = share.comment ? nlohmann::json(*share.comment) : nlohmann::json(nullptr);
  return doc;
}

nlohmann::json status_to_json(const ConnectionStatus& status) {
  nlohmann::json doc = {
    {"state", state_name(status.state())},
    {"text", status.display_text()}
  };
  if(status.state() == ConnectionStatus::State::Offline) {
    doc["reason"] = status.reason();
  }
  return doc;
}

nlohmann::json build_share_report(const std::vector<DiscoveredShare>& shares,
                                  const std::unordered_map<ShareId, ConnectionStatus>& statuses) {
  nlohmann::json list = nlohmann::json::array();
  std::size_t online = 0, offline = 0, manual = 0;
  for(const auto& share : shares) {
    auto status = lookup(statuses, share.id);
    if(status.is_online()) ++online;
    if(status.state() == ConnectionStatus::State::Offline) ++offline;
    if(share.is_manually_added) ++manual;
    auto entry = share_to_json(share);
    entry["status"] = status_to_json(status);
    list.push_back(std::move(entry));
  }
  return {
    {"shares", std::move(list)},
    {"summary", {
      {"total", shares.size()},
      {"online", online},
      {"offline", offline},
      {"manual", manual}
    }}
  };
}

std::vector<std::string> format_share_lines(const std::vector<DiscoveredShare>& shares,
                                            const std::unordered_map<ShareId, ConnectionStatus>& statuses) {
  std::size_t name_width = 0;
  std::size_t url_width = 0;
  for(const auto& share : shares) {
    name_width = std::max(name_width, share.display_name().size());
    url_width = std::max(url_width, share.connection_url().size());
  }
  std::vector<std::string> lines;
  lines.reserve(shares.size());
  for(const auto& share : shares) {
    auto name = share.display_name();
    if(share.is_manually_added) name += " *";
    lines.push_back(fmt::format("{:<{}}  {:<{}}  {}",
                                name, name_width + 2,
                                share.connection_url(), url_width,
                                lookup(statuses, share.id).display_text()));
  }
  return lines;
}
