// EN: Implementation of the ThreadPool class - fixed workers draining a priority queue.
// FR: Implémentation de la classe ThreadPool - workers fixes vidant une queue prioritaire.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace OBF {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::steady_clock::now()) {
    if (config_.worker_threads == 0) {
        throw std::invalid_argument("worker_threads must be at least 1");
    }

    workers_.reserve(config_.worker_threads);
    for (size_t i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.worker_threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(detail::Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }
        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task.sequence = next_sequence_++;
        task_queue_.push(std::move(task));

        // EN: Update peak queue size.
        // FR: Met à jour la taille maximale de la queue.
        size_t current_size = task_queue_.size();
        size_t current_peak = peak_queue_size_.load();
        while (current_size > current_peak &&
               !peak_queue_size_.compare_exchange_weak(current_peak, current_size)) {
        }
    }
    queue_condition_.notify_one();
}

void ThreadPool::post(const std::string& name, TaskPriority priority, std::function<void()> task) {
    detail::Task wrapper;
    wrapper.function = std::move(task);
    wrapper.priority = priority;
    wrapper.name = name;
    enqueue(std::move(wrapper));
}

void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

void ThreadPool::shutdown() {
    if (shutdown_requested_.exchange(true)) {
        return; // EN: Already shutting down. FR: Déjà en cours d'arrêt.
    }

    waitForAll();
    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load()) + " tasks");
}

void ThreadPool::forceShutdown() {
    if (shutdown_requested_.exchange(true)) {
        return;
    }

    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dropped = task_queue_.size();
        std::priority_queue<detail::Task> empty;
        task_queue_.swap(empty);
    }
    if (dropped > 0) {
        LOG_WARN("threadpool", "Forced shutdown dropped " + std::to_string(dropped) + " pending tasks");
    }

    queue_condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

ThreadPoolStats ThreadPool::getStats() const {
    ThreadPoolStats current_stats;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        current_stats.queued_tasks = task_queue_.size();
    }
    current_stats.total_threads = config_.worker_threads;
    current_stats.active_threads = active_threads_.load();
    current_stats.idle_threads = current_stats.total_threads - std::min(current_stats.total_threads,
                                                                         current_stats.active_threads);
    current_stats.completed_tasks = completed_tasks_.load();
    current_stats.failed_tasks = failed_tasks_.load();
    current_stats.peak_queue_size = peak_queue_size_.load();
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        current_stats.average_task_duration_ms = timed_tasks_ == 0 ? 0.0 : total_duration_ms_ / timed_tasks_;
    }
    current_stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    return current_stats;
}

double ThreadPool::currentLoad() const {
    size_t queued = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queued = task_queue_.size();
    }
    double total = static_cast<double>(config_.worker_threads);
    double thread_utilization = static_cast<double>(active_threads_.load()) / total;
    double queue_pressure = std::min(1.0, static_cast<double>(queued) / (total * 2.0));
    return std::min(1.0, std::max(thread_utilization, queue_pressure));
}

void ThreadPool::setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    task_callback_ = std::move(callback);
}

void ThreadPool::workerLoop() {
    while (true) {
        detail::Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_condition_.wait(lock, [this] {
                return !task_queue_.empty() || shutdown_requested_.load();
            });

            if (task_queue_.empty()) {
                // EN: Only reachable on shutdown with nothing left to run.
                // FR: Atteint uniquement à l'arrêt quand il ne reste rien à exécuter.
                break;
            }

            task = std::move(const_cast<detail::Task&>(task_queue_.top()));
            task_queue_.pop();
            active_threads_++;
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;
        try {
            task.function();
        } catch (const std::exception& e) {
            success = false;
            LOG_ERROR("threadpool", "Task '" + task.name + "' failed: " + std::string(e.what()));
        }
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (success) {
            completed_tasks_++;
        } else {
            failed_tasks_++;
        }
        updateStats(task.name, success, duration);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        queue_condition_.notify_all();
    }
}

void ThreadPool::updateStats(const std::string& task_name, bool success, std::chrono::milliseconds duration) {
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        timed_tasks_++;
        total_duration_ms_ += static_cast<double>(duration.count());
    }

    std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = task_callback_;
    }
    if (callback) {
        try {
            callback(task_name, success, duration);
        } catch (const std::exception& e) {
            LOG_ERROR("threadpool", "Task callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace OBF
