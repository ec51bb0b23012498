/**
 * @file ThreadPool.cpp
 * @brief Implementation of the ThreadPool class
 */

#include "../utils/ThreadPool.hpp"

namespace SpreadArb {

ThreadPool::ThreadPool(size_t numThreads, std::shared_ptr<Logger> logger)
    : m_stop(false), m_logger(logger) {
    numThreads = std::max<size_t>(1, numThreads);
    m_logger->info("Initializing thread pool with {} threads", numThreads);

    for (size_t i = 0; i < numThreads; ++i) {
        m_workers.emplace_back([this, i] {
            m_logger->debug("Worker thread {} started", i);
            this->workerThread();
            m_logger->debug("Worker thread {} stopped", i);
        });
    }
}

ThreadPool::~ThreadPool() {
    m_logger->info("Shutting down thread pool");

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stop = true;
    }

    m_condition.notify_all();

    for (std::thread& worker : m_workers) {
        worker.join();
    }

    m_logger->info("Thread pool shutdown complete");
}

void ThreadPool::workerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(m_queueMutex);

            m_condition.wait(lock, [this] {
                return m_stop || !m_tasks.empty();
            });

            // Pending tasks are still run after shutdown is requested
            if (m_stop && m_tasks.empty()) {
                return;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores the task's exception in its future
        try {
            task();
        } catch (const std::exception& e) {
            m_logger->error("Exception in worker thread: {}", e.what());
        }
    }
}

}  // namespace SpreadArb
