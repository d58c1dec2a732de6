#pragma once

#include "pairlink/link/client.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pairlink::link {

/// Active links keyed by caller-chosen connection id. Holds references only; never performs
/// network I/O and never closes a client it drops.
class LinkRegistry {
public:
  /// Last write wins. Returns the displaced client, if any.
  std::shared_ptr<LinkClient> put(const std::string &connection_id,
                                  std::shared_ptr<LinkClient> client);
  [[nodiscard]] std::shared_ptr<LinkClient> get(const std::string &connection_id) const;
  bool remove(const std::string &connection_id);
  [[nodiscard]] bool contains(const std::string &connection_id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::vector<LinkSession> sessions() const;
  void clear();

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<LinkClient>> clients_;
};

} // namespace pairlink::link
