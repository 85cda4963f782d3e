#include "smartscan_core/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace smartscan_core::async {

WorkerPool::WorkerPool(size_t num_threads) : m_num_threads(num_threads) {
    if (num_threads == 0) {
        throw std::invalid_argument("WorkerPool must have at least one thread.");
    }
    m_threads.reserve(num_threads);
}

WorkerPool::~WorkerPool() {
    stop();
}

bool WorkerPool::is_running() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_is_running;
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_is_running) {
        std::cerr << "Warning: WorkerPool is already running." << std::endl;
        return;
    }
    m_stopping = false;
    for (size_t i = 0; i < m_num_threads; ++i) {
        m_threads.emplace_back(&WorkerPool::run_loop, this);
    }
    m_is_running = true;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_is_running) {
            return;
        }
        m_stopping = true;
    }
    m_work_cv.notify_all();
    for (auto& thread : m_threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_threads.clear();

    std::lock_guard<std::mutex> lock(m_mutex);
    m_is_running = false;
}

void WorkerPool::run_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_work_cv.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                return;
            }
            job = std::move(m_queue.front());
            m_queue.pop_front();

            const bool cancelled = m_batch_cancel != nullptr && m_batch_cancel->is_cancelled();
            if (cancelled && !m_batch_error) {
                m_batch_error = std::make_exception_ptr(CancelledError("Batch cancelled"));
            }
            if (m_batch_error) {
                // Batch already failed; discard instead of running
                if (--m_remaining == 0) {
                    m_done_cv.notify_all();
                }
                continue;
            }
        }

        std::exception_ptr error;
        try {
            job();
        } catch (...) {
            error = std::current_exception();
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (error && !m_batch_error) {
            m_batch_error = error;
        }
        if (--m_remaining == 0) {
            m_done_cv.notify_all();
        }
    }
}

void WorkerPool::run_batch(std::vector<Job> jobs, const CancellationToken& cancel) {
    if (jobs.empty()) {
        return;
    }

    // One batch at a time
    std::lock_guard<std::mutex> batch_lock(m_batch_mutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_is_running || m_stopping) {
            throw std::runtime_error("WorkerPool is not running.");
        }
        m_batch_error = nullptr;
        m_batch_cancel = &cancel;
        m_remaining = jobs.size();
        for (auto& job : jobs) {
            m_queue.push_back(std::move(job));
        }
    }
    m_work_cv.notify_all();

    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_done_cv.wait(lock, [this] { return m_remaining == 0; });
        m_batch_cancel = nullptr;
        error = m_batch_error;
        m_batch_error = nullptr;
    }

    if (error) {
        std::rethrow_exception(error);
    }
}

} // namespace smartscan_core::async
