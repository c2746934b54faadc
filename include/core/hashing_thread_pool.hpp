#pragma once

#include <tbb/task_arena.h>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>

/**
 * @brief Bounded worker pool for per-file extraction work
 *
 * Work runs inside a oneTBB task_arena limited to the configured number of
 * threads. Each submission returns a future; exceptions thrown by the work
 * are delivered through it.
 */
class HashingThreadPool
{
public:
    /**
     * @brief Create the pool
     * @param num_threads Worker count, 0 or negative for one per hardware thread
     */
    explicit HashingThreadPool(int num_threads = 0);

    /**
     * @brief Waits for all submitted work
     */
    ~HashingThreadPool();

    HashingThreadPool(const HashingThreadPool &) = delete;
    HashingThreadPool &operator=(const HashingThreadPool &) = delete;

    /**
     * @brief Queue a callable
     * @param work Callable taking no arguments
     * @return Future for the callable's result
     */
    template <typename F>
    auto submit(F &&work) -> std::future<std::invoke_result_t<std::decay_t<F>>>
    {
        using Result = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(work));
        std::future<Result> future = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_++;
        }

        arena_.enqueue([this, task]()
                       {
                           (*task)();
                           completed_.fetch_add(1);
                           taskFinished(); });
        return future;
    }

    /**
     * @brief Block until every submitted item has finished
     */
    void wait();

    /**
     * @brief Number of finished items, counted in completion order
     */
    size_t getCompletedCount() const { return completed_.load(); }

    int getThreadCount() const { return num_threads_; }

    /**
     * @brief Resolve a requested worker count
     * @param requested 0 or negative for hardware concurrency
     * @return Count clamped to [1, 64]
     */
    static int resolveThreadCount(int requested);

    static constexpr int kMaxThreads = 64;

private:
    int num_threads_;
    tbb::task_arena arena_;
    std::atomic<size_t> completed_{0};
    size_t pending_ = 0;
    std::mutex mutex_;
    std::condition_variable done_cv_;

    void taskFinished();
};
