#include "upload_worker_pool.h"
#include "logger.h"

#include <exception>
#include <string>

UploadWorkerPool::UploadWorkerPool(size_t num_workers)
    : m_num_workers(num_workers > 0 ? num_workers : std::thread::hardware_concurrency()),
      m_running(true),
      m_active(0) {
    if (m_num_workers == 0) {
        m_num_workers = 1;
    }

    for (size_t i = 0; i < m_num_workers; ++i) {
        m_workers.emplace_back([this, i] { worker_loop(i); });
    }
    LOG_DEBUG("POOL: Started " + std::to_string(m_num_workers) + " upload workers");
}

UploadWorkerPool::~UploadWorkerPool() {
    shutdown(true);
}

bool UploadWorkerPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running) {
            return false;
        }
        m_queue.push(std::move(task));
    }
    m_queue_cv.notify_one();
    return true;
}

void UploadWorkerPool::shutdown(bool blocking) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        if (!m_running && m_workers.empty()) return;
        m_running = false;
    }

    // Wake all workers
    m_queue_cv.notify_all();

    if (blocking) {
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
    }
}

size_t UploadWorkerPool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(m_queue_mutex);
    return m_queue.size();
}

void UploadWorkerPool::worker_loop(size_t worker_id) {
    while (true) {
        std::unique_lock<std::mutex> lock(m_queue_mutex);

        // Wait for task or shutdown
        m_queue_cv.wait(lock, [this] {
            return !m_queue.empty() || !m_running;
        });

        // Drain the queue before leaving so no scheduler waits on a lost task
        if (m_queue.empty()) {
            break;
        }

        Task task = std::move(m_queue.front());
        m_queue.pop();
        ++m_active;
        lock.unlock();

        // Execute task outside lock
        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("POOL: Worker " + std::to_string(worker_id) + " task threw: " + e.what());
        }
        --m_active;
    }
}
