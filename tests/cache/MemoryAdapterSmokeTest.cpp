#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/memory/MemoryAdapter.hpp"

using namespace flycache::cache;

void smokeTestMemoryAdapter() {
    MemoryAdapter adapter;
    adapter.set("a", "1");
    adapter.set("b", "2");
    auto v = adapter.get("a");
    assert(v && *v == "1");
    assert(!adapter.get("missing"));
    assert(adapter.del("a"));
    assert(!adapter.del("a"));
    assert(!adapter.get("a"));
    std::cout << "[OK] MemoryAdapter smoke test\n";
}

void testCapacityEviction() {
    MemoryAdapterConfig config;
    config.maxEntries = 2;
    MemoryAdapter adapter(config);

    std::vector<std::string> evicted;
    adapter.setEvictionCallback([&evicted](const std::string& key, EvictionReason reason) {
        assert(reason == EvictionReason::Lru);
        evicted.push_back(key);
    });

    adapter.set("a", "1");
    adapter.set("b", "2");
    adapter.set("c", "3");
    assert(!adapter.get("a"));
    assert(adapter.get("b"));
    assert(adapter.get("c"));
    assert(adapter.size() == 2);
    assert(evicted.size() == 1 && evicted[0] == "a");

    // get() обновляет порядок: "b" становится самым свежим
    adapter.get("b");
    adapter.set("d", "4");
    assert(!adapter.get("c"));
    assert(adapter.get("b"));

    auto stats = adapter.getStats();
    assert(stats.evictions == 2);
    std::cout << "[OK] MemoryAdapter capacity eviction\n";
}

void testPassiveTtl() {
    MemoryAdapter adapter;
    adapter.set("temp", "v", 1.0);
    adapter.set("forever", "v");
    assert(adapter.get("temp"));

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));
    assert(!adapter.get("temp"));
    assert(adapter.get("forever"));
    std::cout << "[OK] MemoryAdapter TTL expiry\n";
}

void testActiveExpiry() {
    MemoryAdapter adapter;
    std::mutex mutex;
    std::vector<std::pair<std::string, EvictionReason>> expired;
    adapter.setEvictionCallback([&](const std::string& key, EvictionReason reason) {
        std::lock_guard<std::mutex> lock(mutex);
        expired.emplace_back(key, reason);
    });

    adapter.set("short", "v", 0.1);
    adapter.set("long", "v", 60.0);
    assert(adapter.pendingExpiries() == 2);

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    auto keys = adapter.keys();
    assert(keys.size() == 1 && keys[0] == "long");
    {
        std::lock_guard<std::mutex> lock(mutex);
        assert(expired.size() == 1);
        assert(expired[0].first == "short");
        assert(expired[0].second == EvictionReason::Ttl);
    }
    // Истечение по TTL не считается вытеснением
    assert(adapter.getStats().evictions == 0);
    std::cout << "[OK] MemoryAdapter active expiry\n";
}

void testResetBeforeExpiry() {
    MemoryAdapter adapter;
    adapter.set("k", "old", 0.2);
    adapter.set("k", "new");
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    auto v = adapter.get("k");
    assert(v && *v == "new");
    assert(adapter.pendingExpiries() == 0);
    std::cout << "[OK] MemoryAdapter re-set cancels pending expiry\n";
}

void testDefaultTtl() {
    MemoryAdapterConfig config;
    config.defaultTtlSeconds = 0.1;
    MemoryAdapter adapter(config);
    adapter.set("defaulted", "v");
    adapter.set("explicitZero", "v", 0.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    assert(!adapter.get("defaulted"));
    assert(adapter.get("explicitZero"));
    std::cout << "[OK] MemoryAdapter default TTL\n";
}

void testValidation() {
    MemoryAdapter adapter;
    bool thrown = false;
    try {
        adapter.set("k", "v", -1.0);
    } catch (const ValidationError& e) {
        thrown = true;
        assert(e.field() == "ttl");
    }
    assert(thrown);

    thrown = false;
    try {
        adapter.set("k", "v", std::numeric_limits<double>::infinity());
    } catch (const ValidationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(!adapter.get("k"));

    thrown = false;
    try {
        MemoryAdapterConfig config;
        config.maxEntries = 0;
        MemoryAdapter invalid(config);
    } catch (const ValidationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[OK] MemoryAdapter validation\n";
}

void testStatsKeysClear() {
    MemoryAdapter adapter;
    adapter.mset({{"user:1", "a", std::nullopt}, {"user:2", "b", std::nullopt},
                  {"session:1", "c", std::nullopt}});

    auto values = adapter.mget({"user:1", "nope", "session:1"});
    assert(values.size() == 3);
    assert(values[0] && *values[0] == "a");
    assert(!values[1]);
    assert(values[2] && *values[2] == "c");

    auto stats = adapter.getStats();
    assert(stats.hits == 2);
    assert(stats.misses == 1);
    assert(stats.entryCount == 3);
    assert(stats.memoryUsage == MemoryAdapter::estimateSize("user:1", "a") +
                                MemoryAdapter::estimateSize("user:2", "b") +
                                MemoryAdapter::estimateSize("session:1", "c"));
    assert(std::fabs(stats.hitRate() - 2.0 / 3.0) < 1e-9);

    auto users = adapter.keys(std::string("user:*"));
    assert(users.size() == 2);

    assert(adapter.clear(std::string("user:*")) == 2);
    assert(adapter.size() == 1);
    assert(adapter.clear() == 1);
    assert(adapter.size() == 0);
    assert(adapter.getStats().memoryUsage == 0);

    auto health = adapter.healthCheck();
    assert(health.healthy);
    assert(health.details["maxEntries"] == 1000);
    std::cout << "[OK] MemoryAdapter stats, keys and clear\n";
}

void testDisconnect() {
    MemoryAdapter adapter;
    adapter.set("a", "1", 30.0);
    adapter.set("b", "2");
    adapter.disconnect();
    assert(adapter.size() == 0);
    assert(adapter.pendingExpiries() == 0);
    std::cout << "[OK] MemoryAdapter disconnect\n";
}

void stressTestMemoryAdapter() {
    MemoryAdapterConfig config;
    config.maxEntries = 128;
    MemoryAdapter adapter(config);

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&adapter, t] {
            for (int i = 0; i < 2000; ++i) {
                const std::string key = std::to_string(t) + ":" + std::to_string(i);
                adapter.set(key, "v");
                adapter.get(key);
                if (i % 3 == 0) {
                    adapter.del(key);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    assert(adapter.size() <= 128);
    std::cout << "[OK] MemoryAdapter stress test\n";
}

void testVeryLongTtl() {
    MemoryAdapter adapter;
    adapter.set("decades", "v", 1e9);
    adapter.set("huge", "v", 1e10);
    adapter.set("enormous", "v", std::numeric_limits<double>::max());

    auto v = adapter.get("huge");
    assert(v && *v == "v");
    assert(adapter.get("enormous"));
    assert(adapter.get("decades"));
    // Таймер заводится только для TTL в пределах kMaxExpiringTtlSeconds
    assert(adapter.pendingExpiries() == 1);
    assert(adapter.keys().size() == 3);
    std::cout << "[OK] MemoryAdapter very long TTL\n";
}

int main() {
    smokeTestMemoryAdapter();
    testCapacityEviction();
    testPassiveTtl();
    testActiveExpiry();
    testResetBeforeExpiry();
    testDefaultTtl();
    testVeryLongTtl();
    testValidation();
    testStatsKeysClear();
    testDisconnect();
    stressTestMemoryAdapter();
    std::cout << "All MemoryAdapter tests passed!\n";
    return 0;
}
