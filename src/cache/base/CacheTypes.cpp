#include "flycache/cache/base/CacheTypes.hpp"
#include "flycache/cache/base/CacheErrors.hpp"
#include <cstdio>
#include <ctime>

namespace flycache {
namespace cache {

const char* toString(ChangeType type) {
    switch (type) {
        case ChangeType::Set:      return "set";
        case ChangeType::Delete:   return "delete";
        case ChangeType::Eviction: return "eviction";
    }
    return "unknown";
}

const char* toString(EvictionReason reason) {
    switch (reason) {
        case EvictionReason::Lru: return "lru";
        case EvictionReason::Ttl: return "ttl";
    }
    return "unknown";
}

std::optional<ChangeType> changeTypeFromString(const std::string& text) {
    if (text == "set") return ChangeType::Set;
    if (text == "delete") return ChangeType::Delete;
    if (text == "eviction") return ChangeType::Eviction;
    return std::nullopt;
}

std::optional<EvictionReason> evictionReasonFromString(const std::string& text) {
    if (text == "lru") return EvictionReason::Lru;
    if (text == "ttl") return EvictionReason::Ttl;
    return std::nullopt;
}

std::string formatTimestamp(std::chrono::system_clock::time_point time) {
    const auto sinceEpoch = time.time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);

    std::tm tm{};
    gmtime_r(&seconds, &tm);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
    return buffer;
}

std::string currentTimestamp() {
    return formatTimestamp(std::chrono::system_clock::now());
}

nlohmann::json CacheChangeEvent::toJson() const {
    nlohmann::json j = {
        {"type", toString(type)},
        {"key", key},
        {"timestamp", timestamp}
    };
    if (value) {
        j["value"] = *value;
    }
    if (originId) {
        j["originId"] = *originId;
    }
    if (sequence) {
        j["sequence"] = *sequence;
    }
    if (reason) {
        j["reason"] = toString(*reason);
    }
    return j;
}

CacheChangeEvent CacheChangeEvent::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ValidationError("Change event must be a JSON object", "event", "is_object");
    }

    CacheChangeEvent event;

    const auto typeIt = j.find("type");
    std::optional<ChangeType> type;
    if (typeIt != j.end() && typeIt->is_string()) {
        type = changeTypeFromString(typeIt->get<std::string>());
    }
    if (!type) {
        throw ValidationError("Change event has no valid type", "type",
                              "type in {set, delete, eviction}");
    }
    event.type = *type;

    const auto keyIt = j.find("key");
    if (keyIt == j.end() || !keyIt->is_string() || keyIt->get<std::string>().empty()) {
        throw ValidationError("Change event has no key", "key", "key.length > 0");
    }
    event.key = keyIt->get<std::string>();

    event.timestamp = j.value("timestamp", std::string{});

    const auto valueIt = j.find("value");
    if (event.type == ChangeType::Set && valueIt != j.end() && valueIt->is_string()) {
        event.value = valueIt->get<std::string>();
    }

    const auto originIt = j.find("originId");
    if (originIt != j.end() && originIt->is_string()) {
        event.originId = originIt->get<std::string>();
    }

    const auto sequenceIt = j.find("sequence");
    if (sequenceIt != j.end() && sequenceIt->is_number_integer()) {
        if (!sequenceIt->is_number_unsigned() && sequenceIt->get<int64_t>() < 0) {
            throw ValidationError("Change event sequence is negative", "sequence", "sequence >= 0");
        }
        event.sequence = sequenceIt->get<uint64_t>();
    }

    const auto reasonIt = j.find("reason");
    if (event.type == ChangeType::Eviction && reasonIt != j.end() && reasonIt->is_string()) {
        event.reason = evictionReasonFromString(reasonIt->get<std::string>());
    }

    return event;
}

} // namespace cache
} // namespace flycache
