#ifndef UPLOAD_WORKER_POOL_H
#define UPLOAD_WORKER_POOL_H

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * Fixed pool of worker threads executing chunk uploads.
 * One shared FIFO queue: part uploads carry no ordering requirement, every
 * idle worker picks the oldest task. Bounding the in-flight count per job
 * is the scheduler's job, the pool only bounds the total.
 */
class UploadWorkerPool {
public:
    using Task = std::function<void()>;

    /**
     * Create pool with specified worker count
     * num_workers: number of worker threads (default: CPU count)
     */
    explicit UploadWorkerPool(size_t num_workers = 0);
    ~UploadWorkerPool();

    UploadWorkerPool(const UploadWorkerPool&) = delete;
    UploadWorkerPool& operator=(const UploadWorkerPool&) = delete;

    /**
     * Queue a task.
     * @return false if the pool is shut down (task is dropped)
     */
    bool submit(Task task);

    /**
     * Stop accepting tasks. Tasks already queued still run.
     * blocking: if true, waits for the workers to exit
     */
    void shutdown(bool blocking = true);

    size_t worker_count() const { return m_num_workers; }
    size_t pending_tasks() const;
    size_t active_tasks() const { return m_active.load(); }

private:
    void worker_loop(size_t worker_id);

    size_t m_num_workers;
    std::queue<Task> m_queue;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_queue_cv;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_running;
    std::atomic<size_t> m_active;
};

#endif // UPLOAD_WORKER_POOL_H
