#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <utility>

namespace reconkit::probe {

// Shared keyed memo for expensive auxiliary lookups (geolocation).
//
// For each key at most one loader call is in flight: concurrent callers for
// the same key wait on the winner's result instead of issuing their own.
// Only successful results (an engaged optional) are stored; a failed load is
// handed to its waiters and then forgotten so a later call retries.
template <typename Key, typename Value>
class LookupCache {
public:
  using Loader = std::function<std::optional<Value>()>;

  LookupCache() = default;
  LookupCache(const LookupCache&) = delete;
  LookupCache& operator=(const LookupCache&) = delete;

  std::optional<Value> GetOrPopulate(const Key& key, const Loader& loader) {
    std::promise<std::optional<Value>> promise;
    {
      std::unique_lock<std::mutex> lock(mu_);
      const auto cached = values_.find(key);
      if (cached != values_.end()) {
        return cached->second;
      }
      const auto pending = in_flight_.find(key);
      if (pending != in_flight_.end()) {
        std::shared_future<std::optional<Value>> waiter = pending->second;
        lock.unlock();
        return waiter.get();
      }
      in_flight_.emplace(key, promise.get_future().share());
      ++populate_calls_;
    }

    std::optional<Value> loaded;
    try {
      loaded = loader();
    } catch (const std::exception&) {
      // Release the waiters before rethrowing so nobody blocks on a dead key.
      Publish(key, promise, std::nullopt);
      throw;
    }
    Publish(key, promise, loaded);
    return loaded;
  }

  std::optional<Value> Find(const Key& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = values_.find(key);
    if (it == values_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return values_.size();
  }

  // Number of loader invocations so far, cache misses included.
  std::size_t populate_calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return populate_calls_;
  }

private:
  void Publish(const Key& key, std::promise<std::optional<Value>>& promise,
               const std::optional<Value>& result) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (result.has_value()) {
        values_.insert_or_assign(key, *result);
      }
      in_flight_.erase(key);
    }
    promise.set_value(result);
  }

  mutable std::mutex mu_;
  std::map<Key, Value> values_;
  std::map<Key, std::shared_future<std::optional<Value>>> in_flight_;
  std::size_t populate_calls_ = 0;
};

} // namespace reconkit::probe
