#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "smartscan_core/async/cancellation_token.hpp"

namespace smartscan_core::async {

/**
 * @class WorkerPool
 * @brief Fixed set of threads that run batches of jobs with bounded concurrency.
 *
 * The pool owns its threads for its whole lifetime: start() launches them and
 * stop() (or the destructor) joins them. It follows the RAII principle.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @brief Constructs the pool without starting any thread.
     *
     * @param num_threads The number of worker threads to create in the pool.
     * @throw std::invalid_argument if num_threads is zero.
     */
    explicit WorkerPool(size_t num_threads);

    /**
     * @brief Destructor. Automatically stops and joins all worker threads.
     */
    ~WorkerPool();

    /**
     * @brief Launches the worker threads. Calling it twice only logs a warning.
     */
    void start();

    /**
     * @brief Signals the workers to exit once the queue is drained and joins them.
     */
    void stop();

    /**
     * @brief Runs every job on the pool and blocks until the batch has settled.
     *
     * After the first job throws, or once `cancel` is triggered, queued jobs of the
     * batch are discarded instead of run; jobs already executing finish normally.
     * The first failure (CancelledError for cancellation) is then rethrown here.
     *
     * @throw std::runtime_error if the pool has not been started.
     */
    void run_batch(std::vector<Job> jobs, const CancellationToken& cancel = {});

    size_t size() const { return m_num_threads; }

    bool is_running() const;

    // --- Rule of Five: Make the class non-copyable and non-movable ---
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

private:
    /**
     * @brief The loop each worker thread runs until stop() is called.
     */
    void run_loop();

    size_t m_num_threads;
    std::vector<std::thread> m_threads;
    bool m_is_running = false;
    bool m_stopping = false;

    mutable std::mutex m_mutex;
    std::condition_variable m_work_cv;
    std::condition_variable m_done_cv;
    std::deque<Job> m_queue;

    std::mutex m_batch_mutex;

    // State of the batch currently executing, guarded by m_mutex
    size_t m_remaining = 0;
    std::exception_ptr m_batch_error;
    const CancellationToken* m_batch_cancel = nullptr;
};

} // namespace smartscan_core::async
