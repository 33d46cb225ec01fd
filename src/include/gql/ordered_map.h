#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace gql {

// An associative container with unique keys that remembers insertion order.
//
// Entries are stored contiguously in the order they were added; a side index
// maps each key to its position.  Every "modifying" operation returns a new
// map, so an OrderedMap that has been built is never observed half-updated.
template <typename K, typename V>
class OrderedMap {
  public:
    using key_type = K;
    using mapped_type = V;
    using entry_type = std::pair<K, V>;
    using const_iterator = typename std::vector<entry_type>::const_iterator;

    OrderedMap() = default;

    // Build from a list of pairs. Returns std::nullopt if any key repeats.
    static std::optional<OrderedMap> fromList(const std::vector<entry_type>& pairs) {
        OrderedMap out;
        out.entries_.reserve(pairs.size());
        for (auto const& p : pairs) {
            if (not out.append(p.first, p.second)) return std::nullopt;
        }
        return out;
    }

    static std::optional<OrderedMap> fromList(std::vector<entry_type>&& pairs) {
        OrderedMap out;
        out.entries_.reserve(pairs.size());
        for (auto& p : pairs) {
            if (not out.append(std::move(p.first), std::move(p.second))) return std::nullopt;
        }
        return out;
    }

    static OrderedMap singleton(const K& key, const V& value) {
        OrderedMap out;
        out.append(key, value);
        return out;
    }

    // Merge maps left to right. Any key present in more than one input makes
    // the whole merge fail.
    static std::optional<OrderedMap> unions(const std::vector<OrderedMap>& maps) {
        OrderedMap out;
        for (auto const& m : maps) {
            for (auto const& e : m.entries_) {
                if (not out.append(e.first, e.second)) return std::nullopt;
            }
        }
        return out;
    }

    // Merge maps left to right, resolving a key collision with
    // `combine(existing, incoming)`. Returning std::nullopt from `combine`
    // aborts the merge.
    static std::optional<OrderedMap> unionsWith(
                const std::vector<OrderedMap>& maps,
                const std::function<std::optional<V>(const V&, const V&)>& combine) {
        OrderedMap out;
        for (auto const& m : maps) {
            for (auto const& e : m.entries_) {
                auto it = out.index_.find(e.first);
                if (it == out.index_.end()) {
                    out.append(e.first, e.second);
                    continue;
                }
                auto merged = combine(out.entries_[it->second].second, e.second);
                if (not merged) return std::nullopt;
                out.entries_[it->second].second = std::move(*merged);
            }
        }
        return out;
    }

    // A copy with (key, value) appended, or std::nullopt if `key` is taken.
    std::optional<OrderedMap> insert(const K& key, const V& value) const {
        if (contains(key)) return std::nullopt;
        OrderedMap out = *this;
        out.append(key, value);
        return out;
    }

    // A copy where `key` maps to `value`. An existing key keeps its position.
    OrderedMap replace(const K& key, const V& value) const {
        OrderedMap out = *this;
        auto it = out.index_.find(key);
        if (it == out.index_.end())
            out.append(key, value);
        else
            out.entries_[it->second].second = value;
        return out;
    }

    const V* lookup(const K& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) return nullptr;
        return &entries_[it->second].second;
    }

    bool contains(const K& key) const { return index_.count(key) != 0; }
    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    std::vector<K> keys() const {
        std::vector<K> out;
        out.reserve(entries_.size());
        for (auto const& e : entries_) out.push_back(e.first);
        return out;
    }

    std::vector<V> values() const {
        std::vector<V> out;
        out.reserve(entries_.size());
        for (auto const& e : entries_) out.push_back(e.second);
        return out;
    }

    const std::vector<entry_type>& toList() const noexcept { return entries_; }

    const_iterator begin() const noexcept { return entries_.begin(); }
    const_iterator end() const noexcept { return entries_.end(); }

    // Order is significant: {a:1, b:2} != {b:2, a:1}.
    bool operator==(const OrderedMap& rhs) const { return entries_ == rhs.entries_; }
    bool operator!=(const OrderedMap& rhs) const { return not(*this == rhs); }
    bool operator<(const OrderedMap& rhs) const {
        return std::lexicographical_compare(entries_.begin(), entries_.end(),
                                            rhs.entries_.begin(), rhs.entries_.end());
    }

  private:
    template <typename KK, typename VV>
    bool append(KK&& key, VV&& value) {
        if (index_.count(key) != 0) return false;
        index_.emplace(key, entries_.size());
        entries_.emplace_back(std::forward<KK>(key), std::forward<VV>(value));
        return true;
    }

    std::vector<entry_type> entries_;
    std::map<K, std::size_t> index_;
};

}  // namespace gql
