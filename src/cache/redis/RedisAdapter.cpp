#include "flycache/cache/redis/RedisAdapter.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/logging/Logging.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace flycache {
namespace cache {

namespace {

const char* kLoggerName = "redisadapter";
constexpr const char* kScanCount = "100";

using InfoSection = std::unordered_map<std::string, std::string>;

// Разбор ответа INFO: строки "поле:значение", комментарии начинаются с '#'
InfoSection parseInfo(const std::string& text) {
    InfoSection fields;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        fields[line.substr(0, colon)] = line.substr(colon + 1);
    }
    return fields;
}

uint64_t infoNumber(const InfoSection& fields, const std::string& name) {
    auto it = fields.find(name);
    if (it == fields.end()) {
        return 0;
    }
    try {
        return std::stoull(it->second);
    } catch (const std::exception&) {
        return 0;
    }
}

// "keys=12,expires=3,avg_ttl=0" -> 12
uint64_t keyspaceKeys(const InfoSection& fields, int db) {
    auto it = fields.find("db" + std::to_string(db));
    if (it == fields.end()) {
        return 0;
    }
    const std::string& value = it->second;
    const std::string prefix = "keys=";
    const auto pos = value.find(prefix);
    if (pos == std::string::npos) {
        return 0;
    }
    try {
        return std::stoull(value.substr(pos + prefix.size()));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

RedisAdapter::RedisAdapter(const RedisAdapterConfig& config)
    : config_(config)
    , connection_(std::make_unique<RedisConnection>(config, "command"))
    , startTime_(std::chrono::steady_clock::now()) {
    logging::getLogger(kLoggerName)->info("RedisAdapter created for {}:{} db {}",
                                          config_.host, config_.port, config_.db);
}

RedisAdapter::~RedisAdapter() = default;

long long RedisAdapter::ttlToMilliseconds(double ttlSeconds) {
    // Redis отвергает PSETEX, если now + ttl выходит за int64 миллисекунд
    const double capped = std::min(ttlSeconds, kMaxExpiringTtlSeconds);
    return std::max(1LL, std::llround(capped * 1000.0));
}

void RedisAdapter::checkMgetReply(const RedisReply& reply, size_t keyCount) {
    if (reply.type != RedisReply::Type::Array) {
        throw OperationError("Unexpected MGET reply", "mget", "", std::nullopt,
                             "expected an array reply", "RedisAdapter");
    }
    if (reply.elements.size() != keyCount) {
        throw OperationError("Unexpected MGET reply", "mget", "", std::nullopt,
                             "expected " + std::to_string(keyCount) + " elements, got " +
                                 std::to_string(reply.elements.size()),
                             "RedisAdapter");
    }
}

std::optional<std::string> RedisAdapter::get(const std::string& key) {
    validateKey(key, name());

    const RedisReply reply = connection_->command({"GET", key}, "get", key);
    if (reply.isNil()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return reply.str;
}

void RedisAdapter::set(const std::string& key, const std::string& value,
                       std::optional<double> ttlSeconds) {
    validateKey(key, name());
    validateTtl(ttlSeconds, name());

    if (expiresAfter(ttlSeconds)) {
        connection_->command({"PSETEX", key, std::to_string(ttlToMilliseconds(*ttlSeconds)), value},
                             "set", key, ttlSeconds);
    } else {
        connection_->command({"SET", key, value}, "set", key, ttlSeconds);
    }
    logging::getLogger(kLoggerName)->debug("SET {}", key);
}

bool RedisAdapter::del(const std::string& key) {
    validateKey(key, name());

    const RedisReply reply = connection_->command({"DEL", key}, "delete", key);
    return reply.integer > 0;
}

std::vector<std::optional<std::string>> RedisAdapter::mget(const std::vector<std::string>& keys) {
    for (const auto& key : keys) {
        validateKey(key, name());
    }
    if (keys.empty()) {
        return {};
    }

    std::vector<std::string> args;
    args.reserve(keys.size() + 1);
    args.push_back("MGET");
    args.insert(args.end(), keys.begin(), keys.end());

    const RedisReply reply = connection_->command(args, "mget");
    checkMgetReply(reply, keys.size());

    std::vector<std::optional<std::string>> results;
    results.reserve(keys.size());
    for (const auto& element : reply.elements) {
        if (element.isNil()) {
            ++misses_;
            results.push_back(std::nullopt);
        } else {
            ++hits_;
            results.push_back(element.str);
        }
    }
    return results;
}

void RedisAdapter::mset(const std::vector<BatchEntry>& entries) {
    for (const auto& entry : entries) {
        validateKey(entry.key, name());
        validateTtl(entry.ttlSeconds, name());
    }
    if (entries.empty()) {
        return;
    }

    std::vector<std::vector<std::string>> commands;
    commands.reserve(entries.size());
    for (const auto& entry : entries) {
        if (expiresAfter(entry.ttlSeconds)) {
            commands.push_back({"PSETEX", entry.key,
                                std::to_string(ttlToMilliseconds(*entry.ttlSeconds)), entry.value});
        } else {
            commands.push_back({"SET", entry.key, entry.value});
        }
    }

    connection_->pipeline(commands, "mset");
    logging::getLogger(kLoggerName)->debug("MSET {} entries", entries.size());
}

template <typename Visitor>
void RedisAdapter::scan(const std::string& pattern, Visitor&& visit) {
    std::string cursor = "0";
    do {
        const RedisReply reply = connection_->command(
            {"SCAN", cursor, "MATCH", pattern, "COUNT", kScanCount}, "scan", pattern);
        if (reply.elements.size() != 2) {
            throw OperationError("Unexpected SCAN reply", "scan", pattern, std::nullopt,
                                 "expected [cursor, keys]", name());
        }

        cursor = reply.elements[0].str;
        std::vector<std::string> batch;
        batch.reserve(reply.elements[1].elements.size());
        for (const auto& element : reply.elements[1].elements) {
            batch.push_back(element.str);
        }
        if (!batch.empty()) {
            visit(batch);
        }
    } while (cursor != "0");
}

std::vector<std::string> RedisAdapter::keys(const std::optional<std::string>& pattern) {
    std::vector<std::string> result;
    scan(pattern.value_or("*"), [&result](const std::vector<std::string>& batch) {
        result.insert(result.end(), batch.begin(), batch.end());
    });

    // SCAN может вернуть ключ несколько раз
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

size_t RedisAdapter::clear(const std::optional<std::string>& pattern) {
    const std::string match = pattern.value_or("*");
    size_t removed = 0;

    scan(match, [this, &removed](const std::vector<std::string>& batch) {
        std::vector<std::string> args;
        args.reserve(batch.size() + 1);
        args.push_back("DEL");
        args.insert(args.end(), batch.begin(), batch.end());
        const RedisReply reply = connection_->command(args, "clear");
        removed += static_cast<size_t>(std::max(0LL, reply.integer));
    });

    logging::getLogger(kLoggerName)->debug("Cleared {} keys (pattern={})", removed, match);
    return removed;
}

CacheStats RedisAdapter::getStats() {
    const InfoSection stats = parseInfo(connection_->command({"INFO", "stats"}, "getStats").str);
    const InfoSection memory = parseInfo(connection_->command({"INFO", "memory"}, "getStats").str);
    const InfoSection keyspace = parseInfo(connection_->command({"INFO", "keyspace"}, "getStats").str);

    CacheStats result;
    result.hits = hits_.load();
    result.misses = misses_.load();
    result.evictions = infoNumber(stats, "evicted_keys");
    result.memoryUsage = infoNumber(memory, "used_memory");
    result.entryCount = keyspaceKeys(keyspace, config_.db);
    result.uptime = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_).count());
    return result;
}

void RedisAdapter::connect() {
    connection_->connect();
}

void RedisAdapter::disconnect() {
    connection_->disconnect();
}

HealthStatus RedisAdapter::healthCheck() {
    HealthStatus status;
    status.details = {
        {"host", config_.host},
        {"port", config_.port},
        {"db", config_.db},
        {"state", toString(connection_->state())}
    };

    try {
        const auto started = std::chrono::steady_clock::now();
        const RedisReply reply = connection_->command({"PING"}, "healthCheck");
        const auto latency = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();

        status.healthy = reply.str == "PONG";
        status.message = status.healthy ? "Redis connection healthy"
                                        : "Unexpected PING reply: " + reply.str;
        status.details["latencyMs"] = latency;
    } catch (const CacheError& e) {
        status.healthy = false;
        status.message = e.what();
        status.details["connectionAttempts"] = connection_->connectionAttempts();
        logging::getLogger(kLoggerName)->warn("Health check failed: {}", e.what());
    }
    return status;
}

std::shared_ptr<RedisPubSub> RedisAdapter::createPubSub(const std::string& originId) const {
    return std::make_shared<RedisPubSub>(config_, originId);
}

} // namespace cache
} // namespace flycache
