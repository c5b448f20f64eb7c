/**
 *  @file       hot_store.hpp
 *  @author     The causeway contributors
 *
 *  In-memory store for correlated events.
 *
 *  The HotStore keeps every correlated event in a primary table keyed by
 *  event ID, with secondary indexes by timestamp, producer, symbol and
 *  correlation ID for the query layer. Storage is volatile; events leave
 *  only through pruning.
 */

#ifndef CAUSEWAY_STORAGE_HOT_STORE_HPP_
#define CAUSEWAY_STORAGE_HOT_STORE_HPP_

#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <absl/container/flat_hash_map.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace causeway::storage
{

/**
 *  Order of time-range query results.
 */
enum class SortOrder : std::uint8_t
{
    kAscending = 0,
    kDescending = 1,
};

/**
 *  Query limit meaning "no limit".
 */
inline constexpr std::size_t kUnlimited = std::numeric_limits<std::size_t>::max();

/**
 *  Sizes and counters of a HotStore.
 */
struct HotStoreStats
{
    std::size_t events{0};

    /**
     *  Distinct keys in each secondary index.
     */
    std::size_t producers{0};
    std::size_t symbols{0};
    std::size_t correlations{0};

    std::optional<core::TimestampNs> oldest_timestamp;
    std::optional<core::TimestampNs> newest_timestamp;

    std::uint64_t inserted{0};
    std::uint64_t replaced{0};
    std::uint64_t pruned{0};
};

/**
 *  Multi-indexed in-memory store of correlated events.
 *
 *  A write updates the primary table and every applicable index under one
 *  exclusive lock; queries take a shared lock and return copies.
 *
 *  Thread-safety: all methods may be called concurrently.
 */
class HotStore
{
  public:
    HotStore() = default;

    HotStore(const HotStore&) = delete;
    auto operator=(const HotStore&) -> HotStore& = delete;

    /**
     *  Stores an event. An event with the same ID is replaced.
     */
    void put(core::CorrelatedEvent event);

    void putBatch(std::vector<core::CorrelatedEvent> events);

    [[nodiscard]] auto get(core::EventId id) const
        -> std::expected<core::CorrelatedEvent, core::StoreError>;

    /**
     *  Returns events with start <= timestamp <= end.
     *
     *  @param      start  First timestamp (inclusive).
     *  @param      end    Last timestamp (inclusive).
     *  @param      limit  Maximum number of events returned.
     *  @param      order  kAscending returns the oldest events first.
     *  @return     Matching events, or StoreError::kInvalidRange if start > end.
     */
    [[nodiscard]] auto queryTimeRange(core::TimestampNs start, core::TimestampNs end,
                                      std::size_t limit = kUnlimited,
                                      SortOrder order = SortOrder::kAscending) const
        -> std::expected<std::vector<core::CorrelatedEvent>, core::StoreError>;

    [[nodiscard]] auto queryByProducer(core::ProducerId producer,
                                       std::size_t limit = kUnlimited) const
        -> std::vector<core::CorrelatedEvent>;

    /**
     *  Returns events with a symbol key, e.g. "module.function/arity".
     */
    [[nodiscard]] auto queryBySymbol(std::string_view symbol, std::size_t limit = kUnlimited) const
        -> std::vector<core::CorrelatedEvent>;

    [[nodiscard]] auto queryByCorrelation(core::CorrelationId correlation_id,
                                          std::size_t limit = kUnlimited) const
        -> std::vector<core::CorrelatedEvent>;

    /**
     *  Removes every event with timestamp < cutoff from the table and all indexes.
     *
     *  @return     Number of events removed.
     */
    auto prune(core::TimestampNs cutoff) -> std::size_t;

    /**
     *  Removes the oldest events until at most max_events remain.
     *
     *  @return     Number of events removed.
     */
    auto pruneToSize(std::size_t max_events) -> std::size_t;

    [[nodiscard]] auto stats() const -> HotStoreStats;

    [[nodiscard]] auto size() const -> std::size_t;

    void clear();

  private:
    using IdSet = std::set<core::EventId>;

    void insertLocked(core::CorrelatedEvent event);

    /**
     *  Removes an event from the primary table and every index.
     */
    void removeLocked(core::EventId id);

    /**
     *  Copies the events named by ids, in ID order, up to limit.
     */
    [[nodiscard]] auto collectLocked(const IdSet& ids, std::size_t limit) const
        -> std::vector<core::CorrelatedEvent>;

    mutable std::shared_mutex mutex_;

    absl::flat_hash_map<core::EventId, core::CorrelatedEvent> events_;

    std::set<std::pair<core::TimestampNs, core::EventId>> by_time_;
    absl::flat_hash_map<core::ProducerId, IdSet> by_producer_;
    absl::flat_hash_map<std::string, IdSet> by_symbol_;
    absl::flat_hash_map<core::CorrelationId, IdSet> by_correlation_;

    std::uint64_t inserted_{0};
    std::uint64_t replaced_{0};
    std::uint64_t pruned_{0};
};

}  // namespace causeway::storage

#endif  // CAUSEWAY_STORAGE_HOT_STORE_HPP_
