//
// Created by gregorian-rayne on 2/10/26.
//

#ifndef DUA_CONCURRENT_MAP_HPP
#define DUA_CONCURRENT_MAP_HPP

/**
 * @file concurrent_map.hpp
 * @brief Sharded hash map safe for concurrent insert/update.
 *
 * Keys are distributed over a fixed number of shards, each guarded by its
 * own reader/writer lock, so producers working on different keys rarely
 * contend. Every operation holds at most one shard lock and never calls
 * user code that could take another, so no operation blocks indefinitely.
 */

#include <algorithm>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dua::utils {

    template<typename K, typename V, typename Hash = std::hash<K>>
    class ConcurrentMap {
    public:
        /**
         * @param shard_count Number of shards (at least 1). A map confined
         *                    to one thread can use a single shard.
         */
        explicit ConcurrentMap(std::size_t shard_count = 16)
            : shards_(std::max<std::size_t>(shard_count, 1)) {}

        ConcurrentMap(const ConcurrentMap&) = delete;
        ConcurrentMap& operator=(const ConcurrentMap&) = delete;

        /**
         * Inserts the value unless the key is present. The first writer wins.
         *
         * @return A pair of the stored value and whether this call inserted it.
         */
        std::pair<V, bool> insert_if_absent(const K& key, V value) {
            auto& shard = shard_for(key);
            std::unique_lock lock(shard.mutex);
            auto [it, inserted] = shard.entries.try_emplace(key, std::move(value));
            return {it->second, inserted};
        }

        /**
         * Inserts a default-constructed value if needed, then applies the
         * merge function to the stored value under the shard lock.
         */
        template<typename F>
        void upsert(const K& key, F&& merge) {
            auto& shard = shard_for(key);
            std::unique_lock lock(shard.mutex);
            std::forward<F>(merge)(shard.entries[key]);
        }

        [[nodiscard]] std::optional<V> find(const K& key) const {
            const auto& shard = shard_for(key);
            std::shared_lock lock(shard.mutex);
            if (const auto it = shard.entries.find(key); it != shard.entries.end()) {
                return it->second;
            }
            return std::nullopt;
        }

        [[nodiscard]] bool contains(const K& key) const {
            const auto& shard = shard_for(key);
            std::shared_lock lock(shard.mutex);
            return shard.entries.contains(key);
        }

        [[nodiscard]] std::size_t size() const {
            std::size_t total = 0;
            for (const auto& shard : shards_) {
                std::shared_lock lock(shard.mutex);
                total += shard.entries.size();
            }
            return total;
        }

        [[nodiscard]] bool empty() const {
            return size() == 0;
        }

        /**
         * Copies every entry out of the map. Entries are in no particular
         * order; callers that need determinism must sort.
         */
        [[nodiscard]] std::vector<std::pair<K, V>> snapshot() const {
            std::vector<std::pair<K, V>> result;
            for (const auto& shard : shards_) {
                std::shared_lock lock(shard.mutex);
                result.insert(result.end(), shard.entries.begin(), shard.entries.end());
            }
            return result;
        }

        void clear() {
            for (auto& shard : shards_) {
                std::unique_lock lock(shard.mutex);
                shard.entries.clear();
            }
        }

        [[nodiscard]] std::size_t shard_count() const noexcept {
            return shards_.size();
        }

    private:
        struct Shard {
            mutable std::shared_mutex mutex;
            std::unordered_map<K, V, Hash> entries;
        };

        Shard& shard_for(const K& key) {
            return shards_[Hash{}(key) % shards_.size()];
        }

        const Shard& shard_for(const K& key) const {
            return shards_[Hash{}(key) % shards_.size()];
        }

        std::vector<Shard> shards_;
    };

}  // namespace dua::utils

#endif //DUA_CONCURRENT_MAP_HPP
