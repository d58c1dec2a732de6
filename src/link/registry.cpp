#include "pairlink/link/registry.hpp"

#include <algorithm>

namespace pairlink::link {

std::shared_ptr<LinkClient> LinkRegistry::put(const std::string &connection_id,
                                              std::shared_ptr<LinkClient> client) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &slot = clients_[connection_id];
  std::shared_ptr<LinkClient> displaced = std::move(slot);
  slot = std::move(client);
  return displaced;
}

std::shared_ptr<LinkClient> LinkRegistry::get(const std::string &connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = clients_.find(connection_id);
  return it == clients_.end() ? nullptr : it->second;
}

bool LinkRegistry::remove(const std::string &connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.erase(connection_id) > 0;
}

bool LinkRegistry::contains(const std::string &connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.contains(connection_id);
}

std::size_t LinkRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return clients_.size();
}

std::vector<std::string> LinkRegistry::ids() const {
  std::vector<std::string> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(clients_.size());
    for (const auto &[id, client] : clients_) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<LinkSession> LinkRegistry::sessions() const {
  std::vector<std::pair<std::string, std::shared_ptr<LinkClient>>> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.assign(clients_.begin(), clients_.end());
  }
  std::sort(snapshot.begin(), snapshot.end(),
            [](const auto &a, const auto &b) { return a.first < b.first; });

  std::vector<LinkSession> out;
  out.reserve(snapshot.size());
  for (const auto &[id, client] : snapshot) {
    if (client != nullptr) {
      out.push_back(client->session(id));
    }
  }
  return out;
}

void LinkRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  clients_.clear();
}

} // namespace pairlink::link
