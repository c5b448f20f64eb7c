/**
 *  @file       test_sharded_map.cpp
 *  @author     The causeway contributors
 *
 *  Unit tests for the sharded concurrent map.
 */

#include "causeway/correlation/sharded_map.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using causeway::correlation::ShardedMap;

TEST_CASE("ShardedMap basic operations", "[sharded_map][ShardedMap]")
{
    ShardedMap<std::uint64_t, std::string> map;

    REQUIRE(map.size() == 0);
    REQUIRE_FALSE(map.find(1).has_value());
    REQUIRE_FALSE(map.contains(1));

    map.insertOrAssign(1, "one");
    map.insertOrAssign(2, "two");

    SECTION("find returns a copy of the value")
    {
        REQUIRE(map.find(1) == std::optional<std::string>("one"));
        REQUIRE(map.contains(2));
        REQUIRE(map.size() == 2);
    }

    SECTION("insertOrAssign replaces")
    {
        map.insertOrAssign(1, "uno");
        REQUIRE(map.find(1) == std::optional<std::string>("uno"));
        REQUIRE(map.size() == 2);
    }

    SECTION("erase")
    {
        REQUIRE(map.erase(1));
        REQUIRE_FALSE(map.erase(1));
        REQUIRE_FALSE(map.contains(1));
        REQUIRE(map.size() == 1);
    }

    SECTION("clear")
    {
        map.clear();
        REQUIRE(map.size() == 0);
    }
}

TEST_CASE("ShardedMap update and mutate", "[sharded_map][ShardedMap]")
{
    ShardedMap<std::uint64_t, std::vector<int>> map;

    SECTION("update creates missing entries")
    {
        auto size = map.update(7, [](std::vector<int>& values)
                               {
                                   values.push_back(1);
                                   return values.size();
                               });
        REQUIRE(size == 1);

        size = map.update(7, [](std::vector<int>& values)
                          {
                              values.push_back(2);
                              return values.size();
                          });
        REQUIRE(size == 2);
        REQUIRE(map.find(7)->size() == 2);
    }

    SECTION("mutate skips missing entries")
    {
        bool called = false;
        auto existed = map.mutate(7, [&called](std::vector<int>& /*values*/)
                                  {
                                      called = true;
                                      return true;
                                  });
        REQUIRE_FALSE(existed);
        REQUIRE_FALSE(called);
        REQUIRE_FALSE(map.contains(7));
    }

    SECTION("mutate erases when told not to keep the entry")
    {
        map.insertOrAssign(7, {1, 2});

        auto existed = map.mutate(7, [](std::vector<int>& values)
                                  {
                                      values.pop_back();
                                      return !values.empty();
                                  });
        REQUIRE(existed);
        REQUIRE(map.find(7)->size() == 1);

        existed = map.mutate(7, [](std::vector<int>& values)
                             {
                                 values.pop_back();
                                 return !values.empty();
                             });
        REQUIRE(existed);
        REQUIRE_FALSE(map.contains(7));
    }
}

TEST_CASE("ShardedMap sweeps by predicate", "[sharded_map][ShardedMap]")
{
    ShardedMap<std::uint64_t, std::uint64_t, 4> map;
    for (std::uint64_t i = 0; i < 100; ++i)
    {
        map.insertOrAssign(i, i * 10);
    }

    SECTION("sweeping every shard visits every entry once")
    {
        std::size_t erased = 0;
        for (std::size_t shard = 0; shard < decltype(map)::shardCount(); ++shard)
        {
            auto keys = map.sweepShard(shard, [](std::uint64_t key, std::uint64_t& /*value*/)
                                       { return key % 2 == 0; });
            for (auto key : keys)
            {
                REQUIRE(key % 2 == 0);
            }
            erased += keys.size();
        }

        REQUIRE(erased == 50);
        REQUIRE(map.size() == 50);
    }

    SECTION("eraseIf")
    {
        auto erased = map.eraseIf([](std::uint64_t /*key*/, std::uint64_t& value)
                                  { return value >= 500; });
        REQUIRE(erased == 50);
        REQUIRE(map.contains(49));
        REQUIRE_FALSE(map.contains(50));
    }

    SECTION("forEach")
    {
        std::uint64_t sum = 0;
        map.forEach([&sum](std::uint64_t /*key*/, const std::uint64_t& value) { sum += value; });
        REQUIRE(sum == 49500);
    }
}

TEST_CASE("ShardedMap handles concurrent writers", "[sharded_map][ShardedMap]")
{
    constexpr std::size_t kThreads = 4;
    constexpr std::size_t kIncrements = 5000;

    ShardedMap<std::uint64_t, std::uint64_t> map;

    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < kThreads; ++t)
        {
            threads.emplace_back(
                [&map]
                {
                    for (std::size_t i = 0; i < kIncrements; ++i)
                    {
                        map.update(i % 64, [](std::uint64_t& count) { return ++count; });
                    }
                });
        }
    }

    REQUIRE(map.size() == 64);

    std::uint64_t total = 0;
    map.forEach([&total](std::uint64_t /*key*/, const std::uint64_t& count) { total += count; });
    REQUIRE(total == kThreads * kIncrements);
}
