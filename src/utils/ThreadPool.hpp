/**
 * @file ThreadPool.hpp
 * @brief Fixed-size thread pool for running scan strategies in parallel
 */

#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <atomic>
#include <stdexcept>
#include <type_traits>
#include <algorithm>
#include "../utils/Logger.hpp"

namespace SpreadArb {

/**
 * @class ThreadPool
 * @brief Thread pool for parallel task execution
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class ThreadPool {
public:
    /**
     * @brief Constructor
     * @param numThreads Number of worker threads, at least one is started
     * @param logger Logger instance
     */
    ThreadPool(size_t numThreads, std::shared_ptr<Logger> logger);

    /**
     * @brief Destructor, drains the queue and joins all workers
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueue a task
     * @param f Callable to execute
     * @param args Arguments bound to the callable
     * @return Future result of the task
     */
    template<class F, class... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::result_of<F(Args...)>::type>;

    /**
     * @brief Get the optimal number of threads for computation tasks
     * @param factor Adjustment factor (0.0-1.0) to control thread usage percentage
     * @return Optimal number of threads
     */
    static size_t getOptimalThreadCount(float factor = 0.75f) {
        unsigned int hwThreads = std::thread::hardware_concurrency();
        if (hwThreads == 0) {
            hwThreads = 4;
        }

        size_t optimalThreads = static_cast<size_t>(hwThreads * factor);
        return std::max<size_t>(1, optimalThreads);
    }

private:
    /**
     * @brief Worker thread function
     */
    void workerThread();

    std::vector<std::thread> m_workers;           ///< Worker threads
    std::queue<std::function<void()>> m_tasks;    ///< Task queue

    std::mutex m_queueMutex;                      ///< Mutex for task queue
    std::condition_variable m_condition;          ///< Signals new tasks or shutdown

    bool m_stop;                                  ///< Guarded by m_queueMutex

    std::shared_ptr<Logger> m_logger;             ///< Logger instance
};

template<class F, class... Args>
auto ThreadPool::enqueue(F&& f, Args&&... args)
    -> std::future<typename std::result_of<F(Args...)>::type> {
    using return_type = typename std::result_of<F(Args...)>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(m_queueMutex);

        if (m_stop) {
            throw std::runtime_error("Cannot enqueue task on stopped ThreadPool");
        }

        m_tasks.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return res;
}

}  // namespace SpreadArb
