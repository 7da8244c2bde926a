#include <catch2/catch_test_macros.hpp>
#include "transcache/utils/LRUCache.hpp"
#include "transcache/utils/PendingQueue.hpp"

#include <string>
#include <vector>

using transcache::utils::LRUCache;
using transcache::utils::PendingQueue;

TEST_CASE("LRUCache evicts in access order", "[utils][lru]")
{
    LRUCache<std::string, int> lru(2);
    REQUIRE(lru.put("a", 1) == 0);
    REQUIRE(lru.put("b", 2) == 0);
    REQUIRE(lru.get("a") != nullptr);
    REQUIRE(lru.put("c", 3) == 1);

    REQUIRE(lru.peek("b") == nullptr);
    REQUIRE(*lru.peek("a") == 1);
    REQUIRE(*lru.peek("c") == 3);
}

TEST_CASE("LRUCache peek does not promote", "[utils][lru]")
{
    LRUCache<std::string, int> lru(2);
    lru.put("a", 1);
    lru.put("b", 2);
    REQUIRE(lru.peek("a") != nullptr);
    lru.put("c", 3);
    REQUIRE(lru.peek("a") == nullptr);
}

TEST_CASE("LRUCache capacity changes trim immediately", "[utils][lru]")
{
    LRUCache<int, int> lru(5);
    for (int i = 0; i < 5; ++i)
        lru.put(i, i);
    lru.setCapacity(2);
    REQUIRE(lru.size() == 2);
    REQUIRE(lru.peek(4) != nullptr);
    REQUIRE(lru.peek(3) != nullptr);

    lru.setCapacity(0);
    REQUIRE(lru.empty());
    REQUIRE(lru.put(9, 9) == 0);
    REQUIRE(lru.size() == 0);
}

TEST_CASE("PendingQueue drains everything in order", "[utils][queue]")
{
    PendingQueue<int> q;
    q.push(1);
    q.push(2);
    REQUIRE(q.size() == 2);

    std::vector<int> out{0};
    REQUIRE(q.drain(out) == 2);
    REQUIRE(out == std::vector<int>{0, 1, 2});
    REQUIRE(q.empty());
}
