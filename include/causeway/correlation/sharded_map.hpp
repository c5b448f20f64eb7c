/**
 *  @file       sharded_map.hpp
 *  @author     The causeway contributors
 *
 *  Hash map split into independently locked shards.
 *
 *  Each key hashes to one shard guarded by its own reader/writer lock, so
 *  lookups proceed concurrently and a write or delete only excludes the
 *  shard it touches. Used for the correlator's tables, where cleanup sweeps
 *  must interleave with batch correlation without a whole-table lock.
 */

#ifndef CAUSEWAY_CORRELATION_SHARDED_MAP_HPP_
#define CAUSEWAY_CORRELATION_SHARDED_MAP_HPP_

#include <absl/container/flat_hash_map.h>
#include <absl/hash/hash.h>

#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

namespace causeway::correlation
{

/**
 *  Concurrent map with per-shard reader/writer locking.
 *
 *  Values are returned by copy; callbacks run under the shard lock and must
 *  not re-enter the map.
 *
 *  @tparam     Key        Key type, hashable with absl::Hash.
 *  @tparam     Value      Mapped type.
 *  @tparam     NumShards  Number of independently locked shards.
 */
template <typename Key, typename Value, std::size_t NumShards = 16>
class ShardedMap
{
    static_assert(NumShards > 0, "ShardedMap needs at least one shard");

  public:
    ShardedMap() = default;

    ShardedMap(const ShardedMap&) = delete;
    auto operator=(const ShardedMap&) -> ShardedMap& = delete;

    [[nodiscard]] auto find(const Key& key) const -> std::optional<Value>
    {
        const auto& shard = shardFor(key);
        std::shared_lock lock(shard.mutex);

        auto it = shard.entries.find(key);
        if (it == shard.entries.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto contains(const Key& key) const -> bool
    {
        const auto& shard = shardFor(key);
        std::shared_lock lock(shard.mutex);
        return shard.entries.contains(key);
    }

    /**
     *  Inserts or replaces the value for a key.
     */
    void insertOrAssign(const Key& key, Value value)
    {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        shard.entries.insert_or_assign(key, std::move(value));
    }

    /**
     *  Applies fn to the value for key, default-constructing it if absent.
     *
     *  @return     Whatever fn returns.
     */
    template <typename Fn>
    auto update(const Key& key, Fn&& fn)
    {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        return std::forward<Fn>(fn)(shard.entries[key]);
    }

    /**
     *  Applies fn to an existing value and erases it when fn returns false.
     *
     *  @return     True if the key was present.
     */
    template <typename Fn>
    auto mutate(const Key& key, Fn&& fn) -> bool
    {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);

        auto it = shard.entries.find(key);
        if (it == shard.entries.end())
        {
            return false;
        }

        if (!std::forward<Fn>(fn)(it->second))
        {
            shard.entries.erase(it);
        }
        return true;
    }

    /**
     *  Removes a key. Removing an absent key is a no-op.
     *
     *  @return     True if an entry was removed.
     */
    auto erase(const Key& key) -> bool
    {
        auto& shard = shardFor(key);
        std::unique_lock lock(shard.mutex);
        return shard.entries.erase(key) > 0;
    }

    /**
     *  Runs pred over every entry of one shard, erasing those it accepts.
     *
     *  pred may also modify the value of entries it keeps.
     *
     *  @param      index  Shard index, below shardCount().
     *  @param      pred   Called as pred(const Key&, Value&) -> bool.
     *  @return     Keys of the erased entries.
     */
    template <typename Pred>
    auto sweepShard(std::size_t index, Pred&& pred) -> std::vector<Key>
    {
        std::vector<Key> erased;

        auto& shard = shards_[index % NumShards];
        std::unique_lock lock(shard.mutex);

        for (auto it = shard.entries.begin(); it != shard.entries.end();)
        {
            if (pred(it->first, it->second))
            {
                erased.push_back(it->first);
                shard.entries.erase(it++);
            }
            else
            {
                ++it;
            }
        }

        return erased;
    }

    /**
     *  Erases every entry accepted by pred across all shards.
     *
     *  @return     Number of entries erased.
     */
    template <typename Pred>
    auto eraseIf(Pred&& pred) -> std::size_t
    {
        std::size_t count = 0;
        for (std::size_t i = 0; i < NumShards; ++i)
        {
            count += sweepShard(i, pred).size();
        }
        return count;
    }

    /**
     *  Calls fn(const Key&, const Value&) for every entry, one shard at a time.
     */
    template <typename Fn>
    void forEach(Fn&& fn) const
    {
        for (const auto& shard : shards_)
        {
            std::shared_lock lock(shard.mutex);
            for (const auto& [key, value] : shard.entries)
            {
                fn(key, value);
            }
        }
    }

    /**
     *  Entry count, summed shard by shard; not a consistent snapshot.
     */
    [[nodiscard]] auto size() const -> std::size_t
    {
        std::size_t total = 0;
        for (const auto& shard : shards_)
        {
            std::shared_lock lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

    void clear()
    {
        for (auto& shard : shards_)
        {
            std::unique_lock lock(shard.mutex);
            shard.entries.clear();
        }
    }

    [[nodiscard]] static constexpr auto shardCount() noexcept -> std::size_t
    {
        return NumShards;
    }

  private:
    struct alignas(64) Shard
    {
        mutable std::shared_mutex mutex;
        absl::flat_hash_map<Key, Value> entries;
    };

    [[nodiscard]] auto shardFor(const Key& key) -> Shard&
    {
        return shards_[absl::Hash<Key>{}(key) % NumShards];
    }

    [[nodiscard]] auto shardFor(const Key& key) const -> const Shard&
    {
        return shards_[absl::Hash<Key>{}(key) % NumShards];
    }

    std::array<Shard, NumShards> shards_;
};

}  // namespace causeway::correlation

#endif  // CAUSEWAY_CORRELATION_SHARDED_MAP_HPP_
