#pragma once

#include <cstddef>
#include <functional>
#include <unordered_map>
#include <vector>

namespace allot::util {

// Dense ordered set: O(1) insert, O(1) membership and O(1) erase by swapping the
// erased slot with the last element. Iteration order is insertion order until the
// first erase.
template <typename Key, typename Hash = std::hash<Key>>
class IndexedSet {
public:
  bool insert(const Key& key) {
    if (positions_.contains(key)) {
      return false;
    }
    positions_.emplace(key, items_.size());
    items_.push_back(key);
    return true;
  }

  bool erase(const Key& key) {
    const auto found = positions_.find(key);
    if (found == positions_.end()) {
      return false;
    }

    const std::size_t slot = found->second;
    const std::size_t last = items_.size() - 1U;
    if (slot != last) {
      items_[slot] = items_[last];
      positions_[items_[slot]] = slot;
    }
    items_.pop_back();
    positions_.erase(key);
    return true;
  }

  [[nodiscard]] bool contains(const Key& key) const { return positions_.contains(key); }
  [[nodiscard]] std::size_t size() const { return items_.size(); }
  [[nodiscard]] bool empty() const { return items_.empty(); }
  [[nodiscard]] const std::vector<Key>& items() const { return items_; }

private:
  std::vector<Key> items_;
  std::unordered_map<Key, std::size_t, Hash> positions_;
};

}  // namespace allot::util
