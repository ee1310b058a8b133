#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "flycache/cache/base/CacheErrors.hpp"
#include "flycache/cache/base/GlobPattern.hpp"
#include "flycache/cache/base/PubSub.hpp"
#include "flycache/cache/manager/CacheService.hpp"
#include "flycache/cache/memory/MemoryAdapter.hpp"

using namespace flycache::cache;

namespace {

// Брокер в памяти: доставляет сериализованное событие всем подписчикам,
// чей шаблон совпадает с каналом
class LoopbackBroker {
public:
    struct Subscription {
        uint64_t id;
        std::string pattern;
        PubSub::EventHandler handler;
    };

    uint64_t add(const std::string& pattern, PubSub::EventHandler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = nextId_++;
        subscriptions_.push_back({id, pattern, std::move(handler)});
        return id;
    }

    void remove(uint64_t id) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = subscriptions_.begin(); it != subscriptions_.end(); ++it) {
            if (it->id == id) {
                subscriptions_.erase(it);
                return;
            }
        }
    }

    void publish(const std::string& channel, const std::string& payload) {
        std::vector<Subscription> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot = subscriptions_;
            ++published_;
        }
        const auto event = CacheChangeEvent::fromJson(nlohmann::json::parse(payload));
        for (const auto& subscription : snapshot) {
            if (!globMatch(subscription.pattern, channel)) {
                continue;
            }
            subscription.handler(event);
        }
    }

    size_t published() {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

private:
    std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t nextId_ = 1;
    size_t published_ = 0;
};

class LoopbackPubSub : public PubSub {
public:
    explicit LoopbackPubSub(std::shared_ptr<LoopbackBroker> broker)
        : broker_(std::move(broker)) {}

    void connect() override { connected_ = true; }
    void disconnect() override { connected_ = false; }

    void publish(const std::string& pattern, const CacheChangeEvent& event) override {
        if (!connected_) {
            throw ConnectionError("Loopback transport is not connected", "loopback", 0,
                                  "not connected", "LoopbackPubSub");
        }
        broker_->publish(channelForPattern(pattern, "LoopbackPubSub"), event.toJson().dump());
    }

    Unsubscribe subscribe(const std::string& pattern, EventHandler handler) override {
        const uint64_t id = broker_->add(pattern, std::move(handler));
        auto broker = broker_;
        return [broker, id]() { broker->remove(id); };
    }

private:
    std::shared_ptr<LoopbackBroker> broker_;
    std::atomic<bool> connected_{false};
};

struct Recorder {
    std::mutex mutex;
    std::vector<CacheChangeEvent> events;

    CacheService::EventHandler handler() {
        return [this](const CacheChangeEvent& event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        };
    }

    std::vector<CacheChangeEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }
};

std::unique_ptr<CacheService> makeProcess(const std::shared_ptr<LoopbackBroker>& broker,
                                          const std::string& originId) {
    CacheServiceConfig config;
    config.originId = originId;
    auto service = std::make_unique<CacheService>(std::make_shared<MemoryAdapter>(),
                                                  std::make_shared<LoopbackPubSub>(broker),
                                                  config);
    service->connect();
    service->init();
    return service;
}

} // namespace

void testEchoSuppression() {
    auto broker = std::make_shared<LoopbackBroker>();
    auto processA = makeProcess(broker, "A");
    auto processB = makeProcess(broker, "B");

    Recorder localA;
    Recorder remoteB;
    processA->watch(std::regex(".*"), localA.handler());
    processB->watch(std::regex(".*"), remoteB.handler());

    processA->set("x", "1");
    processA->waitForPendingPublishes();

    auto seenByA = localA.snapshot();
    assert(seenByA.size() == 1);
    assert(seenByA[0].originId && *seenByA[0].originId == "A");

    auto seenByB = remoteB.snapshot();
    assert(seenByB.size() == 1);
    assert(seenByB[0].key == "x");
    assert(seenByB[0].value && *seenByB[0].value == "1");
    assert(seenByB[0].originId && *seenByB[0].originId == "A");

    // Удаленное событие не применяется к хранилищу B и не публикуется повторно
    assert(!processB->get("x"));
    processB->waitForPendingPublishes();
    assert(broker->published() == 1);
    std::cout << "[OK] Echo suppression across processes\n";
}

void testSequenceOrderAcrossTransport() {
    auto broker = std::make_shared<LoopbackBroker>();
    auto processA = makeProcess(broker, "A");
    auto processB = makeProcess(broker, "B");

    Recorder remoteB;
    processB->watch(std::regex("^item:"), remoteB.handler());

    for (int i = 0; i < 50; ++i) {
        processA->set("item:" + std::to_string(i), std::to_string(i));
    }
    processA->del("item:0");
    processA->waitForPendingPublishes();

    auto seen = remoteB.snapshot();
    assert(seen.size() == 51);
    for (size_t i = 1; i < seen.size(); ++i) {
        assert(*seen[i].sequence > *seen[i - 1].sequence);
    }
    assert(seen.back().type == ChangeType::Delete);
    std::cout << "[OK] Per-origin ordering across transport\n";
}

void testSequenceOrderWithConcurrentWriters() {
    auto broker = std::make_shared<LoopbackBroker>();
    auto processA = makeProcess(broker, "A");
    auto processB = makeProcess(broker, "B");

    Recorder remoteB;
    processB->watch(std::regex("^writer"), remoteB.handler());

    constexpr int kWriters = 4;
    constexpr int kWritesPerThread = 100;
    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&processA, w] {
            for (int i = 0; i < kWritesPerThread; ++i) {
                processA->set("writer" + std::to_string(w) + ":" + std::to_string(i), "v");
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    processA->waitForPendingPublishes();

    auto seen = remoteB.snapshot();
    assert(seen.size() == static_cast<size_t>(kWriters * kWritesPerThread));
    for (size_t i = 1; i < seen.size(); ++i) {
        assert(*seen[i].sequence == *seen[i - 1].sequence + 1);
    }
    std::cout << "[OK] Per-origin ordering with concurrent writers\n";
}

void testPublishFailureDoesNotFailMutation() {
    auto broker = std::make_shared<LoopbackBroker>();
    CacheServiceConfig config;
    config.originId = "A";
    // Транспорт не подключен: каждая публикация падает
    CacheService service(std::make_shared<MemoryAdapter>(),
                         std::make_shared<LoopbackPubSub>(broker), config);
    Recorder local;
    service.watch("k", local.handler());

    service.set("k", "v");
    service.waitForPendingPublishes();
    auto v = service.get("k");
    assert(v && *v == "v");
    assert(local.snapshot().size() == 1);
    assert(broker->published() == 0);
    std::cout << "[OK] Publish failure keeps the mutation\n";
}

void testOriginIdRequired() {
    auto broker = std::make_shared<LoopbackBroker>();
    bool thrown = false;
    try {
        CacheService service(std::make_shared<MemoryAdapter>(),
                             std::make_shared<LoopbackPubSub>(broker));
    } catch (const ValidationError& e) {
        thrown = true;
        assert(e.field() == "originId");
    }
    assert(thrown);

    thrown = false;
    try {
        CacheServiceConfig config;
        config.originId = "A";
        config.channelPattern = "cache:[ab]";
        CacheService service(std::make_shared<MemoryAdapter>(),
                             std::make_shared<LoopbackPubSub>(broker), config);
    } catch (const ValidationError& e) {
        thrown = true;
        assert(e.field() == "pattern");
    }
    assert(thrown);
    std::cout << "[OK] PubSub configuration validation\n";
}

void testDisconnectStopsRemoteDelivery() {
    auto broker = std::make_shared<LoopbackBroker>();
    auto processA = makeProcess(broker, "A");
    auto processB = makeProcess(broker, "B");

    Recorder remoteB;
    processB->watch(std::regex(".*"), remoteB.handler());
    processB->disconnect();

    processA->set("x", "1");
    processA->waitForPendingPublishes();
    assert(remoteB.snapshot().empty());
    assert(broker->published() == 1);
    std::cout << "[OK] Disconnected process stops receiving\n";
}

int main() {
    testEchoSuppression();
    testSequenceOrderAcrossTransport();
    testSequenceOrderWithConcurrentWriters();
    testPublishFailureDoesNotFailMutation();
    testOriginIdRequired();
    testDisconnectStopsRemoteDelivery();
    std::cout << "All multi-process tests passed!\n";
    return 0;
}
