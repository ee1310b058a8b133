#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>
#include "flycache/thread/ThreadPool.hpp"

using namespace flycache::thread;

void smokeTestThreadPool() {
    ThreadPoolConfig config;
    config.threadCount = 4;
    ThreadPool pool(config);

    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool.enqueue([&counter] { ++counter; });
    }
    pool.waitForCompletion();
    assert(counter == 100);
    assert(pool.isQueueEmpty());
    assert(pool.getMetrics().totalThreads == 4);
    std::cout << "[OK] ThreadPool smoke test\n";
}

void testSingleWorkerOrdering() {
    ThreadPool pool(ThreadPoolConfig{});
    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 200; ++i) {
        pool.enqueue([&, i] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(i);
        });
    }
    pool.waitForCompletion();
    assert(order.size() == 200);
    for (int i = 0; i < 200; ++i) {
        assert(order[i] == i);
    }
    std::cout << "[OK] ThreadPool FIFO with one worker\n";
}

void testBoundedQueue() {
    ThreadPoolConfig config;
    config.queueSize = 2;
    ThreadPool pool(config);

    std::mutex gate;
    gate.lock();
    std::atomic<bool> started{false};
    pool.enqueue([&] {
        started = true;
        std::lock_guard<std::mutex> lock(gate);
    });
    while (!started) {
        std::this_thread::yield();
    }

    pool.enqueue([] {});
    pool.enqueue([] {});
    bool rejected = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    gate.unlock();
    pool.waitForCompletion();
    std::cout << "[OK] ThreadPool bounded queue\n";
}

void testTaskFailureAndStop() {
    ThreadPool pool(ThreadPoolConfig{});
    std::atomic<int> counter{0};
    pool.enqueue([] { throw std::runtime_error("task failure"); });
    pool.enqueue([&counter] { ++counter; });
    pool.stop();
    assert(counter == 1);

    bool rejected = false;
    try {
        pool.enqueue([] {});
    } catch (const std::runtime_error&) {
        rejected = true;
    }
    assert(rejected);

    bool invalid = false;
    try {
        ThreadPoolConfig config;
        config.threadCount = 0;
        ThreadPool broken(config);
    } catch (const std::invalid_argument&) {
        invalid = true;
    }
    assert(invalid);
    std::cout << "[OK] ThreadPool task failure and stop\n";
}

int main() {
    smokeTestThreadPool();
    testSingleWorkerOrdering();
    testBoundedQueue();
    testTaskFailureAndStop();
    std::cout << "All ThreadPool tests passed!\n";
    return 0;
}
