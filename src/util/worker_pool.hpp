#ifndef PRIVGATE_UTIL_WORKER_POOL_HPP
#define PRIVGATE_UTIL_WORKER_POOL_HPP

#include <vector>
#include <queue>
#include <future>
#include <memory>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <stdexcept>
#include <type_traits>
#include <algorithm>

/**
 * @file worker_pool.hpp
 * @brief Fixed-size worker pool used to fan batch operations out across threads.
 *
 * Batch calls (anonymizeBatch, filterBatch, validateBatch) submit one task per item
 * through mapOrdered(); results come back in input order no matter which worker
 * finished first. An exception thrown by any item is rethrown from mapOrdered()
 * after every task has completed.
 *
 * Usage Example:
 *  @code
 *    privgate::util::WorkerPool pool(4);
 *    std::vector<std::string> in{"a", "b"};
 *    auto out = pool.mapOrdered(in, [](const std::string &s) { return s + "!"; });
 *  @endcode
 */

namespace privgate {
namespace util {

class WorkerPool
{
public:
    /**
     * @param threadCount Number of worker threads. Zero selects hardware concurrency.
     */
    explicit WorkerPool(size_t threadCount = 0)
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

    /**
     * @brief Stops accepting work, drains the queue and joins every worker.
     */
    ~WorkerPool()
    {
        stop();
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const { return workers_.size(); }

    /**
     * @brief Reject further submissions. Queued tasks still run.
     */
    void stop()
    {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            stop_ = true;
        }
        condVar_.notify_all();
    }

    /**
     * @brief Queue a callable; the future carries its result or exception.
     * @throw std::runtime_error if the pool is shutting down.
     */
    template<typename F>
    auto submit(F&& f) -> std::future<typename std::invoke_result<F>::type>
    {
        using return_type = typename std::invoke_result<F>::type;

        auto taskPtr = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
        std::future<return_type> res = taskPtr->get_future();
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            if (stop_) {
                throw std::runtime_error("WorkerPool: submit on stopped pool");
            }
            taskQueue_.emplace([taskPtr]() { (*taskPtr)(); });
        }
        condVar_.notify_one();
        return res;
    }

    /**
     * @brief Apply fn to every input on the pool; output[i] == fn(inputs[i]).
     */
    template<typename In, typename Fn>
    auto mapOrdered(const std::vector<In> &inputs, Fn fn)
        -> std::vector<typename std::invoke_result<Fn, const In&>::type>
    {
        using Out = typename std::invoke_result<Fn, const In&>::type;

        std::vector<std::future<Out>> futures;
        futures.reserve(inputs.size());
        try {
            for (size_t i = 0; i < inputs.size(); ++i) {
                const In *item = &inputs[i];
                futures.push_back(submit([fn, item]() { return fn(*item); }));
            }
        }
        catch (const std::runtime_error &) {
            // Tasks already queued still point into inputs.
            for (auto &f : futures) {
                f.wait();
            }
            throw;
        }

        // Wait for all before rethrowing so no task outlives `inputs`.
        for (auto &f : futures) {
            f.wait();
        }

        std::vector<Out> results;
        results.reserve(inputs.size());
        for (auto &f : futures) {
            results.push_back(f.get());
        }
        return results;
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
} // namespace privgate

#endif // PRIVGATE_UTIL_WORKER_POOL_HPP
