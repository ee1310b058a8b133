#pragma once

#include <vector>
#include <queue>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <string>

namespace flycache {
namespace thread {

// Структура для хранения метрик пула потоков
struct ThreadPoolMetrics {
    size_t activeThreads;    // Количество активных потоков
    size_t queueSize;        // Размер очереди задач
    size_t totalThreads;     // Общее количество потоков
};

// Структура для конфигурации пула потоков
struct ThreadPoolConfig {
    size_t threadCount = 1;          // Количество рабочих потоков
    size_t queueSize = 1024;         // Максимальный размер очереди
    std::string name = "threadpool"; // Имя логгера

    bool validate() const {
        return threadCount > 0 && queueSize > 0 && !name.empty();
    }
};

/**
 * @brief Пул потоков фиксированного размера с ограниченной FIFO-очередью.
 *
 * При threadCount == 1 задачи выполняются строго в порядке постановки.
 * Исключения задач логируются и не покидают рабочий поток.
 */
class ThreadPool {
public:
    // Конструктор с конфигурацией
    explicit ThreadPool(const ThreadPoolConfig& config);

    // Деструктор: дожидается выполнения очереди
    ~ThreadPool();

    // Запрет копирования
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Добавление задачи в очередь
     * @throws std::runtime_error если очередь переполнена или пул остановлен
     */
    void enqueue(std::function<void()> task);

    // Получение количества активных потоков
    size_t getActiveThreadCount() const;

    // Получение размера очереди
    size_t getQueueSize() const;

    // Проверка пустоты очереди
    bool isQueueEmpty() const;

    // Ожидание завершения всех задач
    void waitForCompletion();

    // Остановка пула потоков (оставшиеся задачи выполняются)
    void stop();

    // Получение метрик
    ThreadPoolMetrics getMetrics() const;

    // Получение текущей конфигурации
    ThreadPoolConfig getConfiguration() const;

private:
    // Реализация PIMPL
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace thread
} // namespace flycache
