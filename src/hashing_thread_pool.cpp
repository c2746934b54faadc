#include "core/hashing_thread_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

HashingThreadPool::HashingThreadPool(int num_threads)
    : num_threads_(resolveThreadCount(num_threads)),
      arena_(num_threads_, 0)
{
    Logger::debug("Hashing thread pool initialized with " + std::to_string(num_threads_) + " threads");
}

HashingThreadPool::~HashingThreadPool()
{
    wait();
}

int HashingThreadPool::resolveThreadCount(int requested)
{
    int count = requested;
    if (count <= 0)
        count = static_cast<int>(std::thread::hardware_concurrency());
    if (count <= 0)
        count = 1;
    return std::clamp(count, 1, kMaxThreads);
}

void HashingThreadPool::wait()
{
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]()
                  { return pending_ == 0; });
}

void HashingThreadPool::taskFinished()
{
    std::lock_guard<std::mutex> lock(mutex_);
    pending_--;
    if (pending_ == 0)
        done_cv_.notify_all();
}
