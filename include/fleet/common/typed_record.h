#pragma once

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fleet {

// Insertion-ordered string-keyed map. Keys are unique; set() on an existing key
// replaces the value in place and keeps its original position.
template <typename V> class TypedRecord {
public:
    using value_type = std::pair<std::string, V>;
    using const_iterator = typename std::vector<value_type>::const_iterator;
    using iterator = typename std::vector<value_type>::iterator;

    TypedRecord() = default;
    TypedRecord(std::initializer_list<value_type> init) {
        for (const auto& [k, v] : init)
            set(k, v);
    }

    void set(std::string key, V value) {
        if (auto* existing = find(key)) {
            *existing = std::move(value);
            return;
        }
        entries_.emplace_back(std::move(key), std::move(value));
    }

    V* find(std::string_view key) {
        auto it = locate(key);
        return it == entries_.end() ? nullptr : &it->second;
    }

    const V* find(std::string_view key) const {
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const value_type& e) { return e.first == key; });
        return it == entries_.end() ? nullptr : &it->second;
    }

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    bool erase(std::string_view key) {
        auto it = locate(key);
        if (it == entries_.end())
            return false;
        entries_.erase(it);
        return true;
    }

    std::vector<std::string> keys() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_)
            out.push_back(e.first);
        return out;
    }

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }
    void clear() noexcept { entries_.clear(); }

    iterator begin() { return entries_.begin(); }
    iterator end() { return entries_.end(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const TypedRecord&) const = default;

private:
    iterator locate(std::string_view key) {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&](const value_type& e) { return e.first == key; });
    }

    std::vector<value_type> entries_;
};

} // namespace fleet
