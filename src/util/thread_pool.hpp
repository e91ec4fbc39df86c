#ifndef XPECONOMY_UTIL_THREAD_POOL_HPP
#define XPECONOMY_UTIL_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stdexcept>
#include <algorithm>
#include <type_traits>

/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used to fan out per-account monitoring checks.
 *
 * Usage Example:
 *  @code
 *    xpeconomy::util::ThreadPool pool(4);
 *    auto audit = pool.enqueue([&] { return monitor.AuditAccount("alice"); });
 *    auto findings = audit.get();
 *  @endcode
 */

namespace xpeconomy {
namespace util {

/**
 * @class ThreadPool
 * - Constructor spawns the workers (hardware concurrency when 0 is given).
 * - enqueue(...) schedules a task and returns its future.
 * - Destructor drains the queue, then joins every worker.
 */
class ThreadPool
{
public:
    explicit ThreadPool(size_t threadCount = 0)
        : stop_(false)
    {
        if (threadCount == 0) {
            threadCount = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(threadCount);

        for (size_t i = 0; i < threadCount; ++i) {
            workers_.emplace_back([this] { workerLoop(); });
        }
    }

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

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t size() const { return workers_.size(); }

    /**
     * @brief Enqueue a callable; exceptions it throws surface through the future.
     * @throw std::runtime_error when the pool is shutting down.
     */
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using return_type = typename std::invoke_result<F, Args...>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("enqueue on stopped ThreadPool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

private:
    void workerLoop()
    {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(queueMutex_);
                condVar_.wait(lock, [this] {
                    return !taskQueue_.empty() || stop_;
                });

                if (stop_ && taskQueue_.empty()) {
                    return;
                }
                task = std::move(taskQueue_.front());
                taskQueue_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> taskQueue_;
    std::mutex queueMutex_;
    std::condition_variable condVar_;
    bool stop_;
};

} // namespace util
} // namespace xpeconomy

#endif // XPECONOMY_UTIL_THREAD_POOL_HPP
