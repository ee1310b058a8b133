#include "flycache/thread/ThreadPool.hpp"
#include "flycache/logging/Logging.hpp"
#include <stdexcept>

namespace flycache {
namespace thread {

// Реализация PIMPL
struct ThreadPool::Impl {
    std::vector<std::thread> workers;           // Рабочие потоки
    std::queue<std::function<void()>> tasks;    // Очередь задач
    mutable std::mutex queueMutex;              // Мьютекс для очереди
    std::condition_variable condition;          // Появление задачи или остановка
    std::condition_variable finished;           // Завершение задачи
    bool stop;                                  // Флаг остановки (под queueMutex)
    std::atomic<size_t> activeThreads;          // Количество активных потоков
    ThreadPoolConfig config;                    // Конфигурация пула потоков
    std::shared_ptr<spdlog::logger> logger;

    Impl(const ThreadPoolConfig& cfg) : stop(false), activeThreads(0), config(cfg) {
        logger = logging::getLogger(config.name);

        for (size_t i = 0; i < config.threadCount; ++i) {
            workers.emplace_back([this] {
                processTasks();
            });
        }

        logger->debug("Thread pool initialized: {} threads, queue limit {}",
                      workers.size(), config.queueSize);
    }

    void processTasks() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex);
                condition.wait(lock, [this] {
                    return stop || !tasks.empty();
                });

                if (stop && tasks.empty()) {
                    return;
                }

                task = std::move(tasks.front());
                tasks.pop();
                ++activeThreads;
            }

            try {
                task();
            } catch (const std::exception& e) {
                logger->error("Task execution failed: {}", e.what());
            }

            {
                std::lock_guard<std::mutex> lock(queueMutex);
                --activeThreads;
            }
            finished.notify_all();
        }
    }

    void join() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            stop = true;
        }
        condition.notify_all();

        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }
};

// Конструктор
ThreadPool::ThreadPool(const ThreadPoolConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid thread pool configuration");
    }
    pImpl = std::make_unique<Impl>(config);
}

// Деструктор
ThreadPool::~ThreadPool() {
    pImpl->join();
}

// Добавление задачи в очередь
void ThreadPool::enqueue(std::function<void()> task) {
    if (!task) return;

    {
        std::lock_guard<std::mutex> lock(pImpl->queueMutex);

        if (pImpl->stop) {
            throw std::runtime_error("Thread pool is stopped");
        }

        // Проверка размера очереди
        if (pImpl->tasks.size() >= pImpl->config.queueSize) {
            throw std::runtime_error("Task queue is full");
        }

        pImpl->tasks.push(std::move(task));
    }
    pImpl->condition.notify_one();
}

// Получение количества активных потоков
size_t ThreadPool::getActiveThreadCount() const {
    return pImpl->activeThreads.load();
}

// Получение размера очереди
size_t ThreadPool::getQueueSize() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.size();
}

// Проверка пустоты очереди
bool ThreadPool::isQueueEmpty() const {
    std::lock_guard<std::mutex> lock(pImpl->queueMutex);
    return pImpl->tasks.empty();
}

// Ожидание завершения всех задач
void ThreadPool::waitForCompletion() {
    std::unique_lock<std::mutex> lock(pImpl->queueMutex);
    pImpl->finished.wait(lock, [this] {
        return pImpl->tasks.empty() && pImpl->activeThreads.load() == 0;
    });
}

// Остановка пула потоков
void ThreadPool::stop() {
    pImpl->join();
    pImpl->logger->debug("Thread pool stopped");
}

// Получение метрик
ThreadPoolMetrics ThreadPool::getMetrics() const {
    ThreadPoolMetrics metrics;
    metrics.activeThreads = pImpl->activeThreads.load();
    metrics.queueSize = getQueueSize();
    metrics.totalThreads = pImpl->workers.size();
    return metrics;
}

ThreadPoolConfig ThreadPool::getConfiguration() const {
    return pImpl->config;
}

} // namespace thread
} // namespace flycache
