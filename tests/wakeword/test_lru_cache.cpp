/**
 * test_lru_cache.cpp - Strict LRU eviction and concurrent readers
 */

#include "xvc/wakeword/LruCache.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace xvc::wakeword;

void test_eviction_order() {
    LruCache<std::string, float> cache(2);

    cache.put("a", 1.0f);
    cache.put("b", 2.0f);
    assert(cache.get("a").value() == 1.0f);  // a is now most recent

    cache.put("c", 3.0f);
    assert(cache.size() == 2);
    assert(cache.contains("a"));
    assert(!cache.contains("b"));
    assert(cache.contains("c"));

    // Updating an entry refreshes it
    cache.put("a", 1.5f);
    cache.put("d", 4.0f);
    assert(cache.get("a").value() == 1.5f);
    assert(!cache.contains("c"));

    std::cout << "[PASS] test_eviction_order" << std::endl;
}

void test_hit_miss_counters() {
    LruCache<std::string, int> cache(4);
    assert(!cache.get("missing").has_value());
    cache.put("x", 7);
    assert(cache.get("x").value() == 7);
    assert(cache.get("x").value() == 7);

    assert(cache.hits() == 2);
    assert(cache.misses() == 1);

    cache.clear();
    assert(cache.size() == 0);

    std::cout << "[PASS] test_hit_miss_counters" << std::endl;
}

void test_zero_capacity_holds_one() {
    LruCache<int, int> cache(0);
    assert(cache.capacity() == 1);
    cache.put(1, 1);
    cache.put(2, 2);
    assert(cache.size() == 1);
    assert(cache.contains(2));

    std::cout << "[PASS] test_zero_capacity_holds_one" << std::endl;
}

void test_concurrent_readers_one_writer() {
    LruCache<int, int> cache(64);
    for (int i = 0; i < 64; ++i) cache.put(i, i * 10);

    std::vector<std::thread> readers;
    std::atomic<bool> wrong{false};
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&cache, &wrong, r]() {
            for (int i = 0; i < 20000; ++i) {
                int key = (i + r) % 128;
                if (auto v = cache.get(key)) {
                    if (*v != key * 10) wrong = true;
                }
            }
        });
    }

    std::thread writer([&cache]() {
        for (int i = 64; i < 5000; ++i) {
            cache.put(i % 128, (i % 128) * 10);
        }
    });

    for (auto& t : readers) t.join();
    writer.join();

    assert(!wrong);
    assert(cache.size() <= 64);

    std::cout << "[PASS] test_concurrent_readers_one_writer (hits=" << cache.hits()
              << ", misses=" << cache.misses() << ")" << std::endl;
}

int main() {
    std::cout << "=== LruCache Tests ===" << std::endl;

    test_eviction_order();
    test_hit_miss_counters();
    test_zero_capacity_holds_one();
    test_concurrent_readers_one_writer();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
