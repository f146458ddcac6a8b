#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
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

namespace CIP {

// EN: Thread pool statistics for monitoring.
// FR: Statistiques du pool de threads pour le monitoring.
struct ThreadPoolStats {
    size_t total_threads = 0;
    size_t active_threads = 0;
    size_t queued_tasks = 0;
    size_t completed_tasks = 0;
    size_t failed_tasks = 0;
    size_t peak_active_threads = 0;
    std::chrono::milliseconds total_runtime{0};
};

// EN: Configuration for thread pool size and queue limits.
// FR: Configuration de la taille du pool et des limites de queue.
struct ThreadPoolConfig {
    size_t threads = std::thread::hardware_concurrency();
    size_t max_queue_size = 1000;     // EN: 0 = unbounded / FR: 0 = illimitée
};

namespace detail {
    // EN: Internal task wrapper with a name for logging.
    // FR: Wrapper interne de tâche avec un nom pour le logging.
    struct Task {
        std::function<void()> function;
        std::string name;
    };
}

// EN: Fixed-size worker pool with FIFO queue and futures. One pipeline job occupies one worker.
// FR: Pool de workers de taille fixe avec queue FIFO et futures. Un job de pipeline occupe un worker.
class ThreadPool {
public:
    explicit ThreadPool(const ThreadPoolConfig& config = ThreadPoolConfig{});

    // EN: Destructor - waits for queued tasks then joins all workers.
    // FR: Destructeur - attend les tâches en queue puis joint tous les workers.
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    // EN: Submit a named task; the name appears in the pool's log lines.
    // FR: Soumet une tâche nommée ; le nom apparaît dans les logs du pool.
    template<typename F, typename... Args>
    auto submitNamed(const std::string& name, F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    void waitForAll();
    void shutdown();

    ThreadPoolStats getStats() const;
    size_t size() const { return config_.threads; }

    // EN: Set callback for task completion events (name, success, duration).
    // FR: Définit le callback pour les événements de fin de tâche (nom, succès, durée).
    void setTaskCallback(std::function<void(const std::string&, bool, std::chrono::milliseconds)> callback);

private:
    void workerLoop();
    void notifyCompletion(const std::string& task_name, bool success, std::chrono::milliseconds duration);

    ThreadPoolConfig config_;
    std::vector<std::thread> workers_;

    std::queue<detail::Task> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<size_t> active_threads_{0};
    std::atomic<size_t> peak_active_threads_{0};
    std::atomic<size_t> completed_tasks_{0};
    std::atomic<size_t> failed_tasks_{0};
    std::chrono::steady_clock::time_point start_time_;

    std::function<void(const std::string&, bool, std::chrono::milliseconds)> task_callback_;
    mutable std::mutex callback_mutex_;
};

template<typename F, typename... Args>
auto ThreadPool::submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    return submitNamed("", std::forward<F>(f), std::forward<Args>(args)...);
}

template<typename F, typename... Args>
auto ThreadPool::submitNamed(const std::string& name, F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> result = task->get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);

        if (shutdown_requested_) {
            throw std::runtime_error("ThreadPool is shutting down, cannot accept new tasks");
        }

        if (config_.max_queue_size > 0 && task_queue_.size() >= config_.max_queue_size) {
            throw std::runtime_error("Task queue is full, cannot accept new tasks");
        }

        task_queue_.push(detail::Task{[task]() { (*task)(); }, name});
    }

    queue_condition_.notify_one();
    return result;
}

} // namespace CIP
