// EN: Unit tests for the ThreadPool - priorities, bounded queue, failures and shutdown.
// FR: Tests unitaires du ThreadPool - priorités, queue bornée, échecs et arrêt.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "infrastructure/threading/thread_pool.hpp"
#include "test_helpers.hpp"

using namespace OBF;
using namespace std::chrono_literals;

class ThreadPoolTest : public ::testing::Test {
protected:
    static ThreadPoolConfig singleWorker(size_t max_queue = 0) {
        ThreadPoolConfig config;
        config.worker_threads = 1;
        config.max_queue_size = max_queue;
        return config;
    }

    Testing::QuietLogger quiet_;
};

// EN: Submitted tasks all run and their results come back through futures
// FR: Les tâches soumises s'exécutent toutes et leurs résultats reviennent par les futures
TEST_F(ThreadPoolTest, SubmitReturnsResults) {
    ThreadPoolConfig config;
    config.worker_threads = 3;
    ThreadPool pool(config);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([](int value) { return value * 2; }, i));
    }
    int sum = 0;
    for (auto& future : futures) {
        sum += future.get();
    }
    EXPECT_EQ(sum, 380);
}

// EN: Queued tasks run by priority, FIFO within one priority
// FR: Les tâches en queue s'exécutent par priorité, FIFO au sein d'une priorité
TEST_F(ThreadPoolTest, PriorityOrdering) {
    ThreadPool pool(singleWorker());
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool.post("blocker", TaskPriority::URGENT, [opened] { opened.wait(); });
    std::this_thread::sleep_for(20ms);

    std::mutex mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        return [&, name] {
            std::lock_guard<std::mutex> lock(mutex);
            order.push_back(name);
        };
    };
    pool.post("low", TaskPriority::LOW, record("low"));
    pool.post("normal-1", TaskPriority::NORMAL, record("normal-1"));
    pool.post("high", TaskPriority::HIGH, record("high"));
    pool.post("normal-2", TaskPriority::NORMAL, record("normal-2"));

    gate.set_value();
    pool.waitForAll();

    std::vector<std::string> expected = {"high", "normal-1", "normal-2", "low"};
    EXPECT_EQ(order, expected);
}

// EN: A bounded queue refuses work once full
// FR: Une queue bornée refuse le travail une fois pleine
TEST_F(ThreadPoolTest, BoundedQueueRejectsOverflow) {
    ThreadPool pool(singleWorker(2));
    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool.post("blocker", TaskPriority::NORMAL, [opened] { opened.wait(); });
    std::this_thread::sleep_for(20ms);

    pool.post("queued-1", TaskPriority::NORMAL, [] {});
    pool.post("queued-2", TaskPriority::NORMAL, [] {});
    EXPECT_THROW(pool.post("overflow", TaskPriority::NORMAL, [] {}), std::runtime_error);

    gate.set_value();
    pool.waitForAll();
    EXPECT_EQ(pool.getStats().peak_queue_size, 2u);
}

// EN: A throwing posted task is counted as failed and reported to the callback
// FR: Une tâche postée qui lève est comptée en échec et signalée au callback
TEST_F(ThreadPoolTest, FailedTasksAreCounted) {
    ThreadPool pool(singleWorker());
    std::atomic<int> failures_seen{0};
    pool.setTaskCallback([&](const std::string& name, bool success, std::chrono::milliseconds) {
        if (!success && name == "broken") {
            failures_seen++;
        }
    });

    pool.post("broken", TaskPriority::NORMAL, [] { throw std::runtime_error("boom"); });
    pool.post("fine", TaskPriority::NORMAL, [] {});
    pool.waitForAll();

    auto stats = pool.getStats();
    EXPECT_EQ(stats.failed_tasks, 1u);
    EXPECT_EQ(stats.completed_tasks, 1u);
    EXPECT_EQ(failures_seen.load(), 1);
}

// EN: Shutdown drains queued work, then rejects new submissions
// FR: L'arrêt vide le travail en queue, puis rejette les nouvelles soumissions
TEST_F(ThreadPoolTest, ShutdownDrainsThenRejects) {
    ThreadPoolConfig config;
    config.worker_threads = 2;
    ThreadPool pool(config);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.post("work", TaskPriority::NORMAL, [&done] {
            std::this_thread::sleep_for(2ms);
            done++;
        });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_TRUE(pool.isShutdown());
    EXPECT_THROW(pool.post("late", TaskPriority::NORMAL, [] {}), std::runtime_error);
    pool.shutdown();
}

// EN: Forced shutdown drops pending tasks
// FR: L'arrêt forcé abandonne les tâches en attente
TEST_F(ThreadPoolTest, ForceShutdownDropsPending) {
    ThreadPool pool(singleWorker());
    std::atomic<int> ran{0};
    std::promise<void> started;
    pool.post("slow", TaskPriority::NORMAL, [&] {
        started.set_value();
        std::this_thread::sleep_for(50ms);
        ran++;
    });
    started.get_future().wait();
    for (int i = 0; i < 5; ++i) {
        pool.post("pending", TaskPriority::NORMAL, [&ran] { ran++; });
    }
    pool.forceShutdown();
    EXPECT_EQ(ran.load(), 1);
}

// EN: Load reflects busy workers and stays within [0, 1]
// FR: La charge reflète les workers occupés et reste dans [0, 1]
TEST_F(ThreadPoolTest, CurrentLoad) {
    ThreadPool pool(singleWorker());
    EXPECT_DOUBLE_EQ(pool.currentLoad(), 0.0);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    pool.post("busy", TaskPriority::NORMAL, [opened] { opened.wait(); });
    std::this_thread::sleep_for(20ms);
    EXPECT_DOUBLE_EQ(pool.currentLoad(), 1.0);

    gate.set_value();
    pool.waitForAll();
    EXPECT_DOUBLE_EQ(pool.currentLoad(), 0.0);
}

// EN: Zero workers is a configuration error
// FR: Zéro worker est une erreur de configuration
TEST_F(ThreadPoolTest, ZeroWorkersRejected) {
    ThreadPoolConfig config;
    config.worker_threads = 0;
    EXPECT_THROW(ThreadPool pool(config), std::invalid_argument);
}
