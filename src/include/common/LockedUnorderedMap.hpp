// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Bastion a resilient provisioning engine.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef BASTION_COMMON_LOCKED_UNORDERED_MAP_HPP
#define BASTION_COMMON_LOCKED_UNORDERED_MAP_HPP

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include <cstddef>

namespace bastion {

// unordered_map behind a shared_mutex. No iterators escape the lock; references
// returned by getOrEmplace stay valid because entries are never erased by it.
template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    // Returns the existing value, or constructs one in place from args.
    template<typename... Args>
    std::pair<Value&, bool> getOrEmplace(const Key& key, Args&&... args) {
        {
            std::shared_lock lock{mutex};
            auto it = map.find(key);
            if (it != map.end()) {
                return {it->second, false};
            }
        }
        std::unique_lock lock{mutex};
        auto [it, inserted] = map.try_emplace(key, std::forward<Args>(args)...);
        return {it->second, inserted};
    }

    // Copy of the value, taken under a read lock.
    std::optional<Value> get(const Key& key) const {
        std::shared_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    template<typename V>
    void insertOrAssign(const Key& key, V&& value) {
        std::unique_lock lock{mutex};
        map.insert_or_assign(key, std::forward<V>(value));
    }

    bool erase(const Key& key) {
        std::unique_lock lock{mutex};
        return map.erase(key) > 0;
    }

    // Erases the entry only if pred(value) holds, checked under the write lock.
    template<typename Pred>
    bool eraseIf(const Key& key, Pred pred) {
        std::unique_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end() || !pred(it->second)) {
            return false;
        }
        map.erase(it);
        return true;
    }

    void clear() {
        std::unique_lock lock{mutex};
        map.clear();
    }

    size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

    std::vector<Key> keys() const {
        std::shared_lock lock{mutex};
        std::vector<Key> out;
        out.reserve(map.size());
        for (const auto& entry : map) {
            out.push_back(entry.first);
        }
        return out;
    }

    // f must not call back into this map.
    template<typename F>
    void forEach(F f) {
        std::shared_lock lock{mutex};
        for (auto& entry : map) {
            f(entry.first, entry.second);
        }
    }

    template<typename F>
    void forEach(F f) const {
        std::shared_lock lock{mutex};
        for (const auto& entry : map) {
            f(entry.first, entry.second);
        }
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace bastion

#endif // BASTION_COMMON_LOCKED_UNORDERED_MAP_HPP
