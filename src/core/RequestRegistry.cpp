#include "hitl/RequestRegistry.hpp"

#include "hitl/util/Logger.hpp"

#include <algorithm>
#include <utility>

namespace hitl {

Result<std::size_t> RequestRegistry::insert(const std::string& owner, RequestPtr request) {
  if (!request) {
    return Error{ ErrorCode::Internal, "null request", "registry.insert" };
  }
  const std::string id = request->id();

  std::size_t depth = 0;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (ownerOf_.count(id) > 0) {
      // Never overwrite: the existing waiter would be orphaned.
      return Error{ ErrorCode::DuplicateId, "request id already registered: " + id,
                    "registry.insert" };
    }
    auto& bucket = byOwner_[owner];
    bucket.push_back(std::move(request));
    ownerOf_.emplace(id, owner);
    depth = bucket.size();
  }

  util::logger().log(util::LogLevel::Debug, "registry.insert",
                     { {"owner", owner}, {"id", id}, {"depth", std::to_string(depth)} });
  return depth;
}

bool RequestRegistry::remove(const std::string& owner, const std::string& id) {
  RequestPtr removed;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto oit = ownerOf_.find(id);
    if (oit == ownerOf_.end() || oit->second != owner) return false;

    auto bit = byOwner_.find(owner);
    if (bit != byOwner_.end()) {
      auto& bucket = bit->second;
      auto it = std::find_if(bucket.begin(), bucket.end(),
                             [&id](const RequestPtr& r) { return r->id() == id; });
      if (it != bucket.end()) {
        removed = std::move(*it);
        bucket.erase(it);
      }
      if (bucket.empty()) byOwner_.erase(bit);
    }
    ownerOf_.erase(oit);
  }
  // `removed` is released here, outside the lock.
  return static_cast<bool>(removed);
}

std::vector<RequestRegistry::RequestPtr> RequestRegistry::list(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = byOwner_.find(owner);
  if (it == byOwner_.end()) return {};
  return it->second;
}

Result<RequestRegistry::Found> RequestRegistry::find(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto oit = ownerOf_.find(id);
  if (oit == ownerOf_.end()) {
    return Error{ ErrorCode::NotFound, "no such request: " + id, "registry.find" };
  }
  auto bit = byOwner_.find(oit->second);
  if (bit != byOwner_.end()) {
    for (const auto& r : bit->second) {
      if (r->id() == id) return Found{ oit->second, r };
    }
  }
  // Index and buckets disagree; should never happen.
  return Error{ ErrorCode::Internal, "index out of sync for id: " + id, "registry.find" };
}

std::vector<RequestRegistry::RequestPtr> RequestRegistry::all() const {
  std::vector<RequestPtr> out;
  std::lock_guard<std::mutex> lk(mx_);
  out.reserve(ownerOf_.size());
  for (const auto& kv : byOwner_) {
    out.insert(out.end(), kv.second.begin(), kv.second.end());
  }
  return out;
}

bool RequestRegistry::hasOwner(const std::string& owner) const {
  std::lock_guard<std::mutex> lk(mx_);
  return byOwner_.count(owner) > 0;
}

std::size_t RequestRegistry::ownerCount() const {
  std::lock_guard<std::mutex> lk(mx_);
  return byOwner_.size();
}

std::size_t RequestRegistry::size() const {
  std::lock_guard<std::mutex> lk(mx_);
  return ownerOf_.size();
}

} // namespace hitl
