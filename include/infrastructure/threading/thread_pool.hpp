// EN: Fixed-size priority thread pool hosting the per-session strands of OnboardFlow.
// FR: Pool de threads à priorités de taille fixe hébergeant les strands par session d'OnboardFlow.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace OBF {

// EN: Task priority levels for the thread pool queue.
// FR: Niveaux de priorité des tâches pour la queue du pool de threads.
enum class TaskPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    URGENT = 3
};

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t idle_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    double average_task_duration_ms = 0.0;
    size_t peak_queue_size = 0;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool behavior and limits.
// FR: Configuration pour le comportement et les limites du pool de threads.
struct ThreadPoolConfig {
    // EN: Number of worker threads.
    // FR: Nombre de threads workers.
    size_t worker_threads = std::max(2u, std::thread::hardware_concurrency());

    // EN: Maximum number of queued tasks before submit throws (0 = unbounded).
    // FR: Nombre maximum de tâches en queue avant que submit lève (0 = illimité).
    size_t max_queue_size = 10000;
};

namespace detail {
    // EN: Internal task wrapper with priority, sequence and name.
    // FR: Wrapper interne de tâche avec priorité, séquence et nom.
    struct Task {
        std::function<void()> function;
        TaskPriority priority = TaskPriority::NORMAL;
        uint64_t sequence = 0;
        std::string name;

        // EN: Higher priority first, then FIFO within a priority.
        // FR: Priorité la plus haute d'abord, puis FIFO au sein d'une priorité.
        bool operator<(const Task& other) const {
            if (priority != other.priority) {
                return static_cast<int>(priority) < static_cast<int>(other.priority);
            }
            return sequence > other.sequence;
        }
    };
}

class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - drains the queue then stops all threads.
    // FR: Destructeur - vide la queue puis arrête tous les threads.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task; the name shows up in failure logs and the task callback.
    // FR: Soumet une tâche nommée ; le nom apparaît dans les logs d'échec et le callback.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Fire-and-forget submission; exceptions are counted as failed tasks and logged.
    // FR: Soumission sans retour ; les exceptions comptent comme échecs et sont journalisées.
    void post(const std::string& name, TaskPriority priority, std::function<void()> task);

    // EN: Wait for all currently queued tasks to complete.
    // FR: Attend que toutes les tâches actuellement en queue se terminent.
    void waitForAll();

    void shutdown();

    // EN: Drop pending tasks and join as soon as running ones return.
    // FR: Abandonne les tâches en attente et joint dès que celles en cours retournent.
    void forceShutdown();

    bool isShutdown() const { return shutdown_requested_.load(); }

    ThreadPoolStats getStats() const;

    // EN: Utilization in [0, 1]: max of busy-thread ratio and queue pressure.
    // FR: Utilisation dans [0, 1] : max du ratio de threads occupés et de la pression de queue.
    double currentLoad() const;

    const ThreadPoolConfig& getConfig() const { return config_; }

    void setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback);

private:
    void workerLoop();
    void enqueue(detail::Task task);
    void updateStats(const std::string& task_name, bool success, std::chrono::milliseconds duration);

    ThreadPoolConfig config_;

    std::vector<std::thread> workers_;

    std::priority_queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    uint64_t next_sequence_ = 0;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::atomic<size_t> peak_queue_size_{0};
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex stats_mutex_;
    size_t timed_tasks_ = 0;
    double total_duration_ms_ = 0.0;

    std::function<void(const std::string&, bool, std::chrono::milliseconds)> task_callback_;
    mutable std::mutex callback_mutex_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", priority, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submit(TaskPriority::NORMAL, std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, TaskPriority priority, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    std::future<return_type> result = task->get_future();

    detail::Task wrapper;
    wrapper.function = [task]() { (*task)(); };
    wrapper.priority = priority;
    wrapper.name = name;
    enqueue(std::move(wrapper));

    return result;
}

} // namespace OBF
