// EN: Implementation of the ThreadPool class. Fixed-size workers draining a FIFO queue.
// FR: Implémentation de la classe ThreadPool. Workers de taille fixe vidant une queue FIFO.

#include "infrastructure/threading/thread_pool.hpp"
#include "infrastructure/logging/logger.hpp"

namespace CIP {

ThreadPool::ThreadPool(const ThreadPoolConfig& config)
    : config_(config), start_time_(std::chrono::steady_clock::now()) {

    if (config_.threads == 0) {
        throw std::invalid_argument("ThreadPool needs at least one thread");
    }

    workers_.reserve(config_.threads);
    for (size_t i = 0; i < config_.threads; ++i) {
        workers_.emplace_back(&ThreadPool::workerLoop, this);
    }

    LOG_DEBUG("threadpool", "Thread pool started with " + std::to_string(config_.threads) + " threads");
}

ThreadPool::~ThreadPool() {
    shutdown();
}

// EN: Wait until the queue is empty and no worker is busy.
// FR: Attend que la queue soit vide et qu'aucun worker ne soit occupé.
void ThreadPool::waitForAll() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] {
        return task_queue_.empty() && active_threads_.load() == 0;
    });
}

// EN: Graceful shutdown: queued tasks still run, then workers exit.
// FR: Arrêt gracieux : les tâches en queue s'exécutent, puis les workers sortent.
void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutdown_requested_.exchange(true)) {
            return;
        }
    }

    queue_condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    LOG_DEBUG("threadpool", "Thread pool shutdown completed - Processed " +
              std::to_string(completed_tasks_.load() + failed_tasks_.load()) + " tasks");
}

ThreadPoolStats ThreadPool::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);

    ThreadPoolStats stats;
    stats.total_threads = config_.threads;
    stats.active_threads = active_threads_.load();
    stats.queued_tasks = task_queue_.size();
    stats.completed_tasks = completed_tasks_.load();
    stats.failed_tasks = failed_tasks_.load();
    stats.peak_active_threads = peak_active_threads_.load();
    stats.total_runtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time_);
    return stats;
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
                // EN: Shutdown requested and nothing left to drain.
                // FR: Arrêt demandé et plus rien à vider.
                return;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();

            size_t active = ++active_threads_;
            size_t peak = peak_active_threads_.load();
            while (active > peak && !peak_active_threads_.compare_exchange_weak(peak, active)) {
            }
        }

        auto start = std::chrono::steady_clock::now();
        bool success = true;

        // EN: packaged_task stores exceptions in the future; this only guards the wrapper itself.
        // FR: packaged_task stocke les exceptions dans le future ; ceci protège seulement le wrapper.
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

        notifyCompletion(task.name, success, duration);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_threads_--;
        }
        idle_condition_.notify_all();
    }
}

void ThreadPool::notifyCompletion(const std::string& task_name, bool success, std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (task_callback_) {
        try {
            task_callback_(task_name, success, duration);
        } catch (const std::exception& e) {
            LOG_ERROR("threadpool", "Task callback failed: " + std::string(e.what()));
        }
    }
}

} // namespace CIP
