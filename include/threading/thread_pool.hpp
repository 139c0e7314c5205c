#pragma once

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <type_traits>

namespace syn {

/**
 * @brief Fixed-size pool of worker threads with a FIFO task queue
 *
 * The destructor finishes every queued task before joining the workers.
 */
class ThreadPool {
public:
    explicit ThreadPool(size_t threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queue a task, fire and forget
     * @throws std::runtime_error if the pool is shutting down
     */
    template<class F>
    void enqueue(F&& f);

    /**
     * @brief Queue a task and get a future for its result
     *
     * Exceptions thrown by the task are rethrown by future::get().
     */
    template<class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;

    void worker_loop();
};

template<class F>
void ThreadPool::enqueue(F&& f) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw std::runtime_error("enqueue on stopped ThreadPool");
        }
        tasks_.emplace(std::forward<F>(f));
    }
    condition_.notify_one();
}

template<class F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using Result = std::invoke_result_t<std::decay_t<F>>;

    // std::function needs a copyable callable, packaged_task is move-only
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
    std::future<Result> result = task->get_future();
    enqueue([task]() { (*task)(); });
    return result;
}

} // namespace syn
