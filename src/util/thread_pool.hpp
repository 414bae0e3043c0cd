#ifndef PIIANON_UTIL_THREAD_POOL_HPP
#define PIIANON_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stdexcept>
#include <algorithm>
#include <type_traits>
#include <cstddef>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to process independent anonymization requests.
 *
 * Tasks share nothing but what the caller captures. Request-scoped state (token caches,
 * finding lists) must be created inside the task, never captured by reference.
 *
 * Usage Example:
 *  @code
 *    piianon::util::ThreadPool pool(4);
 *    auto response = pool.enqueue([&service, doc] { return handle(service, doc); });
 *    std::cout << response.get().toJson() << std::endl;
 *  @endcode
 */

namespace piianon {
namespace util {

class ThreadPool
{
public:
    /**
     * @param threadCount Number of workers; 0 means hardware concurrency (at least 1).
     */
    explicit ThreadPool(std::size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

    ThreadPool(const ThreadPool &) = delete;
    ThreadPool& operator=(const ThreadPool &) = delete;

    /**
     * @brief Finishes queued tasks, then joins every worker.
     */
    ~ThreadPool()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    /**
     * @brief Queue @p f for execution. Exceptions thrown by @p f surface from future::get().
     * @throw std::runtime_error if the pool is shutting down.
     */
    template <typename F>
    auto enqueue(F &&f) -> std::future<typename std::invoke_result<F>::type>
    {
        using return_type = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            tasks_.emplace([task]() { (*task)(); });
        }
        condVar_.notify_one();
        return res;
    }

    std::size_t size() const
    {
        return workers_.size();
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) {
                    return;
                }
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace piianon

#endif // PIIANON_UTIL_THREAD_POOL_HPP
