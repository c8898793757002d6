//
//  Map that iterates its items in insertion order. Config tables are
//  written back in the order they were read.
//

#pragma once

#include <algorithm>
#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace patchy {

template <typename K, typename V>
struct OrderedMap {
    std::map<K, V> m_;

    // Keys in insertion order
    std::vector<K> keys_;

    void
    insert(const K& key, V value) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        m_[key] = std::move(value);
    }

    bool
    remove(const K& key) {
        if (!contains(key)) {
            return false;
        }
        keys_.erase(std::remove(keys_.begin(), keys_.end(), key), keys_.end());
        m_.erase(key);
        return true;
    }

    V&
    operator[](const K& key) {
        if (!contains(key)) {
            keys_.push_back(key);
        }
        return m_[key];
    }

    const V*
    find(const K& key) const {
        auto it = m_.find(key);
        return it == m_.end() ? nullptr : &it->second;
    }

    std::size_t
    size() const {
        return keys_.size();
    }

    bool
    contains(const K& key) const {
        return m_.find(key) != m_.end();
    }

    const std::vector<K>&
    keys() const {
        return keys_;
    }

    void
    for_each(const std::function<void(const K&, V&)>& cb) {
        for (const auto& k : keys_) {
            cb(k, m_[k]);
        }
    }

    void
    for_each(const std::function<void(const K&, const V&)>& cb) const {
        for (const auto& k : keys_) {
            cb(k, m_.at(k));
        }
    }
};

}  // namespace patchy
