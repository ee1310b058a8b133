#include "flycache/cache/memory/ExpiryScheduler.hpp"
#include "flycache/logging/Logging.hpp"
#include <utility>

namespace flycache {
namespace cache {

ExpiryScheduler::ExpiryScheduler(Callback onExpire)
    : onExpire_(std::move(onExpire)) {
    logging::getLogger("expiryscheduler");
    worker_ = std::thread([this] { run(); });
}

ExpiryScheduler::~ExpiryScheduler() {
    stop();
}

uint64_t ExpiryScheduler::schedule(const std::string& key, Clock::time_point deadline) {
    uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = nextToken_++;
        timers_.push(Timer{deadline, token, key});
        active_.insert(token);
    }
    condition_.notify_one();
    return token;
}

void ExpiryScheduler::cancel(uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Запись в куче удаляется лениво при извлечении
    active_.erase(token);

    if (timers_.size() > 2 * active_.size() + 1024) {
        std::vector<Timer> live;
        live.reserve(active_.size());
        while (!timers_.empty()) {
            if (active_.count(timers_.top().token) != 0) {
                live.push_back(timers_.top());
            }
            timers_.pop();
        }
        timers_ = decltype(timers_)(Later{}, std::move(live));
    }
}

void ExpiryScheduler::cancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.clear();
    timers_ = decltype(timers_)();
}

size_t ExpiryScheduler::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void ExpiryScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    condition_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    logging::getLogger("expiryscheduler")->debug("Expiry scheduler stopped");
}

void ExpiryScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopped_) {
        // Отброс отмененных таймеров с вершины кучи
        while (!timers_.empty() && active_.count(timers_.top().token) == 0) {
            timers_.pop();
        }

        if (timers_.empty()) {
            condition_.wait(lock, [this] { return stopped_ || !timers_.empty(); });
            continue;
        }

        const auto deadline = timers_.top().deadline;
        if (Clock::now() < deadline) {
            condition_.wait_until(lock, deadline);
            continue;
        }

        Timer timer = timers_.top();
        timers_.pop();
        active_.erase(timer.token);

        lock.unlock();
        try {
            onExpire_(timer.key, timer.token);
        } catch (const std::exception& e) {
            logging::getLogger("expiryscheduler")->error(
                "Expiry callback failed for key '{}': {}", timer.key, e.what());
        }
        lock.lock();
    }
}

} // namespace cache
} // namespace flycache
