/**
 *  @file       hot_store.cpp
 *  @author     The causeway contributors
 *
 *  Implementation of the multi-indexed event store.
 */

#include "causeway/storage/hot_store.hpp"

#include "causeway/core/errors.hpp"
#include "causeway/core/events.hpp"
#include "causeway/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <glog/logging.h>
#include <iterator>
#include <limits>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace causeway::storage
{

namespace
{

/**
 *  Removes id from the set stored under key, dropping the set once empty.
 */
template <typename Index, typename Key>
void eraseFromIndex(Index& index, const Key& key, core::EventId id)
{
    auto it = index.find(key);
    if (it == index.end())
    {
        return;
    }

    it->second.erase(id);
    if (it->second.empty())
    {
        index.erase(it);
    }
}

}  // namespace

void HotStore::put(core::CorrelatedEvent event)
{
    std::unique_lock lock(mutex_);
    insertLocked(std::move(event));
}

void HotStore::putBatch(std::vector<core::CorrelatedEvent> events)
{
    std::unique_lock lock(mutex_);
    for (auto& event : events)
    {
        insertLocked(std::move(event));
    }
}

auto HotStore::get(core::EventId id) const
    -> std::expected<core::CorrelatedEvent, core::StoreError>
{
    std::shared_lock lock(mutex_);

    auto it = events_.find(id);
    if (it == events_.end())
    {
        return std::unexpected(core::StoreError::kNotFound);
    }
    return it->second;
}

auto HotStore::queryTimeRange(core::TimestampNs start, core::TimestampNs end, std::size_t limit,
                              SortOrder order) const
    -> std::expected<std::vector<core::CorrelatedEvent>, core::StoreError>
{
    if (start > end)
    {
        return std::unexpected(core::StoreError::kInvalidRange);
    }

    std::shared_lock lock(mutex_);

    // Bounds over (timestamp, id) pairs cover every ID at both end timestamps
    const auto first = by_time_.lower_bound({start, 0});
    const auto last = by_time_.upper_bound({end, std::numeric_limits<core::EventId>::max()});

    std::vector<core::CorrelatedEvent> result;

    auto append = [&](core::EventId id)
    {
        auto it = events_.find(id);
        if (it != events_.end())
        {
            result.push_back(it->second);
        }
    };

    if (order == SortOrder::kAscending)
    {
        for (auto it = first; it != last && result.size() < limit; ++it)
        {
            append(it->second);
        }
    }
    else
    {
        for (auto it = std::make_reverse_iterator(last);
             it != std::make_reverse_iterator(first) && result.size() < limit; ++it)
        {
            append(it->second);
        }
    }

    return result;
}

auto HotStore::queryByProducer(core::ProducerId producer, std::size_t limit) const
    -> std::vector<core::CorrelatedEvent>
{
    std::shared_lock lock(mutex_);

    auto it = by_producer_.find(producer);
    if (it == by_producer_.end())
    {
        return {};
    }
    return collectLocked(it->second, limit);
}

auto HotStore::queryBySymbol(std::string_view symbol, std::size_t limit) const
    -> std::vector<core::CorrelatedEvent>
{
    std::shared_lock lock(mutex_);

    auto it = by_symbol_.find(symbol);
    if (it == by_symbol_.end())
    {
        return {};
    }
    return collectLocked(it->second, limit);
}

auto HotStore::queryByCorrelation(core::CorrelationId correlation_id, std::size_t limit) const
    -> std::vector<core::CorrelatedEvent>
{
    std::shared_lock lock(mutex_);

    auto it = by_correlation_.find(correlation_id);
    if (it == by_correlation_.end())
    {
        return {};
    }
    return collectLocked(it->second, limit);
}

auto HotStore::prune(core::TimestampNs cutoff) -> std::size_t
{
    std::unique_lock lock(mutex_);

    std::size_t removed = 0;
    while (!by_time_.empty() && by_time_.begin()->first < cutoff)
    {
        removeLocked(by_time_.begin()->second);
        ++removed;
    }

    pruned_ += removed;
    if (removed > 0)
    {
        VLOG(1) << "Pruned " << removed << " events older than " << cutoff;
    }
    return removed;
}

auto HotStore::pruneToSize(std::size_t max_events) -> std::size_t
{
    std::unique_lock lock(mutex_);

    std::size_t removed = 0;
    while (events_.size() > max_events && !by_time_.empty())
    {
        removeLocked(by_time_.begin()->second);
        ++removed;
    }

    pruned_ += removed;
    if (removed > 0)
    {
        VLOG(1) << "Pruned " << removed << " events to stay within " << max_events;
    }
    return removed;
}

auto HotStore::stats() const -> HotStoreStats
{
    std::shared_lock lock(mutex_);

    HotStoreStats stats{
        .events = events_.size(),
        .producers = by_producer_.size(),
        .symbols = by_symbol_.size(),
        .correlations = by_correlation_.size(),
        .oldest_timestamp = std::nullopt,
        .newest_timestamp = std::nullopt,
        .inserted = inserted_,
        .replaced = replaced_,
        .pruned = pruned_,
    };

    if (!by_time_.empty())
    {
        stats.oldest_timestamp = by_time_.begin()->first;
        stats.newest_timestamp = by_time_.rbegin()->first;
    }

    return stats;
}

auto HotStore::size() const -> std::size_t
{
    std::shared_lock lock(mutex_);
    return events_.size();
}

void HotStore::clear()
{
    std::unique_lock lock(mutex_);

    events_.clear();
    by_time_.clear();
    by_producer_.clear();
    by_symbol_.clear();
    by_correlation_.clear();
}

void HotStore::insertLocked(core::CorrelatedEvent event)
{
    const auto id = event.event.id;

    if (events_.contains(id))
    {
        removeLocked(id);
        ++replaced_;
    }

    by_time_.emplace(event.event.timestamp_ns, id);
    by_producer_[event.event.producer].insert(id);
    by_correlation_[event.correlation_id].insert(id);

    if (auto symbol = event.event.symbolKey())
    {
        by_symbol_[std::move(*symbol)].insert(id);
    }

    events_.insert_or_assign(id, std::move(event));
    ++inserted_;
}

void HotStore::removeLocked(core::EventId id)
{
    auto it = events_.find(id);
    if (it == events_.end())
    {
        return;
    }

    const auto& stored = it->second;

    by_time_.erase(std::pair{stored.event.timestamp_ns, id});
    eraseFromIndex(by_producer_, stored.event.producer, id);
    eraseFromIndex(by_correlation_, stored.correlation_id, id);

    if (auto symbol = stored.event.symbolKey())
    {
        eraseFromIndex(by_symbol_, *symbol, id);
    }

    events_.erase(it);
}

auto HotStore::collectLocked(const IdSet& ids, std::size_t limit) const
    -> std::vector<core::CorrelatedEvent>
{
    std::vector<core::CorrelatedEvent> result;

    for (const auto id : ids)
    {
        if (result.size() >= limit)
        {
            break;
        }

        auto it = events_.find(id);
        if (it != events_.end())
        {
            result.push_back(it->second);
        }
    }

    return result;
}

}  // namespace causeway::storage
