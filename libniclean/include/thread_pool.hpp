/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool for the copy+strip step of a batch.
 */

#ifndef NICLEAN_THREAD_POOL_HPP
#define NICLEAN_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <vector>

namespace niclean {

/**
 * @brief A fixed-size thread pool executing tasks in FIFO order.
 *
 * @details Workers are std::jthread, so destruction joins them and running
 * tasks see cancellation through their std::stop_token. With a single
 * worker, tasks run strictly in the order they were enqueued.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = 1);

    /**
     * @brief Stops accepting work, lets queued tasks drain and joins workers.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task accepting a std::stop_token.
     * @return A future for the task's result.
     * @throws std::runtime_error if the pool has been stopped.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks until every enqueued task has finished or been discarded.
     */
    void wait_idle();

    /**
     * @brief Discards queued tasks and signals running ones to stop.
     */
    void request_stop();

    /// @return Number of worker threads.
    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_ and pending_
    std::condition_variable_any condition_; ///< Wakes workers on new tasks or stop
    std::condition_variable idle_cv_;       ///< Wakes wait_idle() when pending_ drops to zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    std::size_t pending_{0};                ///< Tasks queued or running
    std::vector<std::jthread> workers_;
};

} // namespace niclean

#endif // NICLEAN_THREAD_POOL_HPP
