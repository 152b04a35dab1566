//
//  Map wrapper where we can iterate through
//  items in insertion-order.
//

#pragma once

#include <cstddef>
#include <initializer_list>
#include <map>
#include <utility>
#include <vector>

namespace nestdiff {

template <typename T, typename V>
struct OrderedMap {
    using Map = std::map<T, V>;
    Map m_;

    // Array of all map keys in `insert-order`
    std::vector<T> keys_;

    OrderedMap() = default;
    OrderedMap(const OrderedMap& other) = default;
    OrderedMap(OrderedMap&& other) = default;
    OrderedMap& operator=(const OrderedMap& other) = default;
    OrderedMap& operator=(OrderedMap&& other) = default;

    OrderedMap(const std::initializer_list<std::pair<T, V>> kw_args) {
        for (const auto& [key, value] : kw_args) {
            insert(key, value);
        }
    }

    // Insert or overwrite. An overwritten key keeps its original position.
    void
    insert(const T& key, V value) {
        auto [it, inserted] = m_.insert_or_assign(key, std::move(value));
        if (inserted) {
            keys_.push_back(key);
        }
    }

    V&
    operator[](const T& key) {
        if (!m_.contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    const V*
    find(const T& key) const {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    const V&
    at(const T& key) const {
        return m_.at(key);
    }

    bool
    contains(const T& key) const {
        return m_.contains(key);
    }

    std::size_t
    size() const {
        return m_.size();
    }

    bool
    empty() const {
        return m_.empty();
    }

    const std::vector<T>&
    keys() const {
        return keys_;
    }

    template <typename Callback>
    void
    for_each(Callback&& cb) const {
        for (const auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }
};

}  // namespace nestdiff
