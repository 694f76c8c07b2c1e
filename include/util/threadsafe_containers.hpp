// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#ifndef NATFORWARD_UTIL_THREADSAFE_CONTAINERS_HPP
#define NATFORWARD_UTIL_THREADSAFE_CONTAINERS_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace natforward {
namespace util {

/**
 * Mutex-guarded ordered set.
 *
 * Every operation is atomic with respect to the others, so TryInsert can be
 * used as a claim: among concurrent callers with the same key exactly one
 * gets true.
 */
template <typename T, typename Compare = std::less<T>>
class ThreadSafeSet {
public:
  // Insert if absent. Returns true if this call inserted the value.
  bool TryInsert(const T &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_.insert(value).second;
  }

  bool Contains(const T &value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_.find(value) != set_.end();
  }

  bool Erase(const T &value) {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_.erase(value) > 0;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    set_.clear();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_.size();
  }

  bool Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return set_.empty();
  }

  // Snapshot of current contents (sorted)
  std::vector<T> GetValues() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<T>(set_.begin(), set_.end());
  }

private:
  mutable std::mutex mutex_;
  std::set<T, Compare> set_;
};

} // namespace util
} // namespace natforward

#endif // NATFORWARD_UTIL_THREADSAFE_CONTAINERS_HPP
