#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace braces {

// String keyed memo table shared by the facade. Entries are never evicted:
// the store grows with every distinct key for as long as its owner lives.
template<typename V>
class KeyedStore {
  mutable std::mutex                 mutex_;
  std::unordered_map<std::string, V> entries_;

public:
  KeyedStore()  = default;
  ~KeyedStore() = default;

  KeyedStore(KeyedStore const&)            = delete;
  KeyedStore& operator=(KeyedStore const&) = delete;

  [[nodiscard]] std::optional<V> find(std::string const& key) const {
    std::lock_guard lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
      return it->second;
    }
    return std::nullopt;
  }

  void store(std::string key, V value) {
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(std::move(key), std::move(value));
  }

  [[nodiscard]] bool contains(std::string const& key) const {
    std::lock_guard lock(mutex_);
    return entries_.contains(key);
  }

  [[nodiscard]] size_t size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
  }
};

} // namespace braces
