#ifndef RCA_LIB_UTIL_INDEX_MAP_H_
#define RCA_LIB_UTIL_INDEX_MAP_H_

#include <vector>
#include <optional>
#include <cstddef>
#include <iterator>
#include <utility>

namespace util {

// Dense map keyed by small integer ids. Iteration visits present entries in ascending key order.
template<typename K, typename V>
struct index_map {
  typedef K key_t;
  typedef V value_t;

  index_map() = default;

  bool contains(K k) const { return static_cast<size_t>(k) < slots.size() && slots[static_cast<size_t>(k)].has_value(); }

  // returns false (and leaves the map untouched) if the key is already present
  bool insert(K k, V v) {
    const size_t i = static_cast<size_t>(k);
    if (i >= slots.size())slots.resize(i + 1);
    if (slots[i].has_value())return false;
    slots[i].emplace(std::move(v));
    ++count;
    return true;
  }

  void insert_or_assign(K k, V v) {
    const size_t i = static_cast<size_t>(k);
    if (i >= slots.size())slots.resize(i + 1);
    if (!slots[i].has_value())++count;
    slots[i] = std::move(v);
  }

  V *get(K k) { return contains(k) ? &*slots[static_cast<size_t>(k)] : nullptr; }
  const V *get(K k) const { return contains(k) ? &*slots[static_cast<size_t>(k)] : nullptr; }

  V &get_or_insert_default(K k) {
    if (!contains(k))insert(k, V());
    return *get(k);
  }

  size_t size() const { return count; }
  bool empty() const { return count == 0; }
  // one past the largest key ever inserted
  size_t next_key() const { return slots.size(); }

  bool operator==(const index_map &o) const { return count == o.count && trimmed() == o.trimmed(); }
  bool operator!=(const index_map &o) const { return !(*this == o); }

  template<typename Slot, typename Value>
  struct basic_iterator {
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::pair<K, Value &>;
    using difference_type = std::ptrdiff_t;
    Slot *slots;
    size_t pos, end;
    basic_iterator(Slot *slots, size_t pos, size_t end) : slots(slots), pos(pos), end(end) { skip(); }
    void skip() { while (pos < end && !slots[pos].has_value())++pos; }
    std::pair<K, Value &> operator*() const { return {static_cast<K>(pos), *slots[pos]}; }
    basic_iterator &operator++() {
      ++pos;
      skip();
      return *this;
    }
    bool operator==(const basic_iterator &o) const { return pos == o.pos; }
    bool operator!=(const basic_iterator &o) const { return pos != o.pos; }
  };
  typedef basic_iterator<std::optional<V>, V> iterator;
  typedef basic_iterator<const std::optional<V>, const V> const_iterator;

  iterator begin() { return iterator(slots.data(), 0, slots.size()); }
  iterator end() { return iterator(slots.data(), slots.size(), slots.size()); }
  const_iterator begin() const { return const_iterator(slots.data(), 0, slots.size()); }
  const_iterator end() const { return const_iterator(slots.data(), slots.size(), slots.size()); }

 private:
  std::vector<std::optional<V>> trimmed() const {
    std::vector<std::optional<V>> v = slots;
    while (!v.empty() && !v.back().has_value())v.pop_back();
    return v;
  }
  std::vector<std::optional<V>> slots;
  size_t count = 0;
};

}

#endif //RCA_LIB_UTIL_INDEX_MAP_H_
