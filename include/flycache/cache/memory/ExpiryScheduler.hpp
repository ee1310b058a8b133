#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace flycache {
namespace cache {

/**
 * @brief Фоновая очередь таймеров для активного истечения TTL.
 *
 * Один рабочий поток спит до ближайшего срока и вызывает обработчик с ключом
 * и токеном, полученным от schedule(). Отмененные токены не срабатывают.
 * Обработчик вызывается без блокировок планировщика и может сам вызывать
 * schedule()/cancel().
 */
class ExpiryScheduler {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void(const std::string& key, uint64_t token)>;

    explicit ExpiryScheduler(Callback onExpire);
    ~ExpiryScheduler();

    ExpiryScheduler(const ExpiryScheduler&) = delete;
    ExpiryScheduler& operator=(const ExpiryScheduler&) = delete;

    // Запланировать истечение ключа; возвращает токен таймера
    uint64_t schedule(const std::string& key, Clock::time_point deadline);
    // Отменить таймер (повторная отмена безопасна)
    void cancel(uint64_t token);
    void cancelAll();
    size_t pending() const;
    // Остановка рабочего потока
    void stop();

private:
    struct Timer {
        Clock::time_point deadline;
        uint64_t token;
        std::string key;
    };
    struct Later {
        bool operator()(const Timer& a, const Timer& b) const {
            return a.deadline > b.deadline;
        }
    };

    void run();

    Callback onExpire_;
    std::priority_queue<Timer, std::vector<Timer>, Later> timers_;
    std::unordered_set<uint64_t> active_;
    uint64_t nextToken_ = 1;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stopped_{false};
    std::thread worker_;
};

} // namespace cache
} // namespace flycache
