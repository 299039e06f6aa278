#include "capabilities.hpp"

#include <algorithm>

void HostStream::push(DiscoveredHost host) {
  {
    std::lock_guard lg(m_);
    if(closed_) return;
    pending_.push_back(std::move(host));
  }
  cv_.notify_one();
}

void HostStream::close() {
  {
    std::lock_guard lg(m_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool HostStream::is_closed() const {
  std::lock_guard lg(m_);
  return closed_;
}

std::optional<DiscoveredHost> HostStream::next() {
  std::unique_lock<std::mutex> lock(m_);
  cv_.wait(lock, [this]{ return closed_ || !pending_.empty(); });
  if(pending_.empty()) return std::nullopt;
  DiscoveredHost host = std::move(pending_.front());
  pending_.pop_front();
  return host;
}

bool is_administrative_share(const std::string& share_name) {
  return !share_name.empty() && share_name.back() == '$';
}

std::vector<DiscoveredShare> filter_administrative_shares(std::vector<DiscoveredShare> shares) {
  shares.erase(std::remove_if(shares.begin(), shares.end(),
                              [](const DiscoveredShare& share){
                                return is_administrative_share(share.share_name);
                              }),
               shares.end());
  return shares;
}
