#pragma once

#include "hitl/PendingRequest.hpp"
#include "hitl/Result.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hitl {

// Owner -> outstanding requests, insertion ordered. One mutex covers the
// whole map and is only held for the map operation itself.
class RequestRegistry {
public:
  using RequestPtr = std::shared_ptr<PendingRequest>;

  struct Found {
    std::string owner;
    RequestPtr  request;
  };

  // Returns the owner's queue depth after insertion, or DuplicateId.
  Result<std::size_t> insert(const std::string& owner, RequestPtr request);

  // Idempotent. Returns true if something was removed. Drops the owner key
  // when its queue becomes empty.
  bool remove(const std::string& owner, const std::string& id);

  // Snapshot copy in insertion order.
  std::vector<RequestPtr> list(const std::string& owner) const;

  Result<Found> find(const std::string& id) const;

  // Every outstanding request across owners (shutdown / diagnostics).
  std::vector<RequestPtr> all() const;

  bool        hasOwner(const std::string& owner) const;
  std::size_t ownerCount() const;
  std::size_t size() const;

private:
  mutable std::mutex mx_;
  std::unordered_map<std::string, std::vector<RequestPtr>> byOwner_;
  std::unordered_map<std::string, std::string>             ownerOf_;   // id -> owner
};

} // namespace hitl
