#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/base/GlobPattern.hpp"
#include "flycache/cache/base/PubSub.hpp"
#include "flycache/cache/metrics/CacheConfig.hpp"
#include "flycache/logging/Logging.hpp"

using namespace flycache::cache;
using nlohmann::json;

namespace {

template <typename Fn>
bool throwsValidation(Fn&& fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

} // namespace

void testEventJson() {
    CacheChangeEvent event;
    event.type = ChangeType::Set;
    event.key = "user:1";
    event.value = "payload";
    event.timestamp = "2026-10-17T08:30:00.125Z";
    event.originId = "node-a";
    event.sequence = 42;

    const auto wire = json::parse(event.toJson().dump());
    assert(wire["type"] == "set");
    assert(wire["sequence"] == 42);

    const auto decoded = CacheChangeEvent::fromJson(wire);
    assert(decoded.type == ChangeType::Set);
    assert(decoded.key == "user:1");
    assert(decoded.value && *decoded.value == "payload");
    assert(decoded.timestamp == event.timestamp);
    assert(decoded.originId && *decoded.originId == "node-a");
    assert(decoded.sequence && *decoded.sequence == 42);
    assert(!decoded.reason);

    CacheChangeEvent eviction;
    eviction.type = ChangeType::Eviction;
    eviction.key = "old";
    eviction.timestamp = currentTimestamp();
    eviction.reason = EvictionReason::Ttl;
    const auto evictionJson = eviction.toJson();
    assert(!evictionJson.contains("value"));
    assert(!evictionJson.contains("originId"));
    assert(evictionJson["reason"] == "ttl");
    const auto decodedEviction = CacheChangeEvent::fromJson(evictionJson);
    assert(decodedEviction.reason && *decodedEviction.reason == EvictionReason::Ttl);
    std::cout << "[OK] Change event JSON round trip\n";
}

void testEventJsonLenient() {
    // Неизвестные поля игнорируются, value у delete отбрасывается
    const auto decoded = CacheChangeEvent::fromJson(
        json{{"type", "delete"}, {"key", "k"}, {"value", "ignored"}, {"extra", true},
             {"sequence", 7}});
    assert(decoded.type == ChangeType::Delete);
    assert(!decoded.value);
    assert(decoded.sequence && *decoded.sequence == 7);
    assert(decoded.timestamp.empty());
    std::cout << "[OK] Change event ignores unknown fields\n";
}

void testEventJsonRejects() {
    assert(throwsValidation([] { CacheChangeEvent::fromJson(json::array()); }));
    assert(throwsValidation([] { CacheChangeEvent::fromJson(json{{"key", "k"}}); }));
    assert(throwsValidation([] { CacheChangeEvent::fromJson(json{{"type", "update"}, {"key", "k"}}); }));
    assert(throwsValidation([] { CacheChangeEvent::fromJson(json{{"type", "set"}}); }));
    assert(throwsValidation([] { CacheChangeEvent::fromJson(json{{"type", "set"}, {"key", 5}}); }));
    assert(throwsValidation([] {
        CacheChangeEvent::fromJson(json{{"type", "set"}, {"key", "k"}, {"sequence", -1}});
    }));

    bool parseFailed = false;
    try {
        CacheChangeEvent::fromJson(json::parse("{\"type\": \"set\", \"key\""));
    } catch (const json::parse_error&) {
        parseFailed = true;
    }
    assert(parseFailed);
    std::cout << "[OK] Change event rejects malformed input\n";
}

void testTimestampFormat() {
    const auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    assert(formatTimestamp(epoch) == "1970-01-01T00:00:01.500Z");

    const std::string now = currentTimestamp();
    assert(now.size() == 24);
    assert(now[10] == 'T' && now[19] == '.' && now.back() == 'Z');
    std::cout << "[OK] ISO-8601 timestamps\n";
}

void testGlobMatch() {
    assert(globMatch("*", "anything"));
    assert(globMatch("user:*", "user:42"));
    assert(!globMatch("user:*", "session:42"));
    assert(globMatch("h?llo", "hello"));
    assert(!globMatch("h?llo", "hllo"));
    assert(globMatch("h[ae]llo", "hallo"));
    assert(!globMatch("h[ae]llo", "hillo"));
    assert(globMatch("h[^e]llo", "hallo"));
    assert(globMatch("h[a-c]llo", "hbllo"));
    assert(globMatch("a\\*b", "a*b"));
    assert(!globMatch("a\\*b", "axb"));
    assert(globMatch("cache:*", "cache:*"));
    std::cout << "[OK] Glob matching\n";
}

void testChannelForPattern() {
    assert(channelForPattern("cache:*", "test") == "cache:*");
    assert(channelForPattern("cache:?", "test") != channelForPattern("cache:*", "test"));
    assert(throwsValidation([] { channelForPattern("", "test"); }));
    assert(throwsValidation([] { channelForPattern("cache:[ab]", "test"); }));
    assert(throwsValidation([] { channelForPattern("cache:\\*", "test"); }));
    std::cout << "[OK] Channel naming\n";
}

void testValidationHelpers() {
    assert(throwsValidation([] { validateKey("", "test"); }));
    assert(throwsValidation([] { validateKey("  \t", "test"); }));
    validateKey("ok", "test");
    validateTtl(std::nullopt, "test");
    validateTtl(0.0, "test");
    assert(throwsValidation([] { validateTtl(-0.5, "test"); }));

    try {
        validateKey(" ", "RedisAdapter");
        assert(false);
    } catch (const CacheError& e) {
        assert(e.adapter() == "RedisAdapter");
    }
    std::cout << "[OK] Key and TTL validation\n";
}

void testConfigFromJson() {
    const auto memory = MemoryAdapterConfig::fromJson(json{{"maxEntries", 50}, {"defaultTtlSeconds", 2.5}});
    assert(memory.maxEntries == 50);
    assert(memory.defaultTtlSeconds && *memory.defaultTtlSeconds == 2.5);
    assert(memory.validate());

    const auto redis = RedisAdapterConfig::fromJson(
        json{{"host", "cache.local"}, {"port", 6380}, {"db", 2}, {"password", "secret"},
             {"connectTimeoutMs", 250}, {"enableOfflineQueue", false}, {"unknown", 1}});
    assert(redis.host == "cache.local");
    assert(redis.port == 6380);
    assert(redis.db == 2);
    assert(redis.password == "secret");
    assert(redis.connectTimeout == std::chrono::milliseconds(250));
    assert(redis.commandTimeout == std::chrono::milliseconds(5000));
    assert(redis.maxRetriesPerRequest == 3);
    assert(!redis.enableOfflineQueue);
    assert(redis.validate());

    RedisAdapterConfig badPort;
    badPort.port = 70000;
    assert(!badPort.validate());

    const auto service = CacheServiceConfig::fromJson(json{{"originId", "node-1"}});
    assert(service.originId == "node-1");
    assert(service.channelPattern == "cache:*");
    assert(service.publishQueueSize == 1024);

    const auto logging = flycache::logging::LoggingConfig::fromJson(json{{"logDirectory", "/tmp/flycache-logs"}});
    assert(logging.logDirectory == "/tmp/flycache-logs");
    assert(logging.validate());
    std::cout << "[OK] Configuration from JSON\n";
}

void testDefaultRetryStrategy() {
    const auto strategy = defaultRetryStrategy();
    assert(strategy(1) == std::chrono::milliseconds(50));
    assert(strategy(2) == std::chrono::milliseconds(100));
    assert(strategy(5) == std::chrono::milliseconds(800));
    assert(strategy(7) == std::chrono::milliseconds(2000));
    assert(strategy(10) == std::chrono::milliseconds(2000));
    assert(!strategy(11));

    RedisAdapterConfig config;
    assert(config.effectiveRetryStrategy()(1) == std::chrono::milliseconds(50));
    config.retryStrategy = [](unsigned) { return std::optional<std::chrono::milliseconds>{}; };
    assert(!config.effectiveRetryStrategy()(1));
    std::cout << "[OK] Default retry strategy\n";
}

int main() {
    testEventJson();
    testEventJsonLenient();
    testEventJsonRejects();
    testTimestampFormat();
    testGlobMatch();
    testChannelForPattern();
    testValidationHelpers();
    testConfigFromJson();
    testDefaultRetryStrategy();
    std::cout << "All cache event tests passed!\n";
    return 0;
}
