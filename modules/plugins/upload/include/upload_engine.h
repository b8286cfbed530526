#ifndef UPLOAD_ENGINE_H
#define UPLOAD_ENGINE_H

#include "upload_types.h"
#include "network_quality_monitor.h"
#include "concurrency_governor.h"
#include "retry_policy.h"
#include "session_state.h"
#include "upload_worker_pool.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class TransferCoordinator;

/**
 * UPLOAD ENGINE
 *
 * Session object owning everything shared by the jobs of one upload
 * session: network monitor, concurrency governor, worker pool and session
 * state. Each running job gets its own scheduler thread.
 *
 * Usage:
 *   UploadEngine engine(coordinator, UploadEngine::Config::from_config_manager());
 *   std::string id;
 *   UploadError err;
 *   if (engine.start("/data/video.mp4", id, err)) {
 *       engine.wait_for_job(id, std::chrono::hours(1));
 *   }
 */
class UploadEngine {
public:
    struct Config {
        bool low_resource_mode = false;
        double single_upload_threshold_mb = 5.0;
        int max_retries = DEFAULT_MAX_RETRIES;
        int64_t base_retry_delay_ms = DEFAULT_BASE_RETRY_DELAY_MS;
        int64_t base_timeout_ms = DEFAULT_BASE_TIMEOUT_MS;
        std::string snapshot_path = "chunklift_session.json";
        int snapshot_ttl_hours = 168;
        int probe_timeout_ms = 2000;
        double default_bandwidth_mbps = 5.0;
        double default_latency_ms = 100.0;
        int success_window = 5;

        static Config from_config_manager();
    };

    UploadEngine(TransferCoordinator& coordinator, const Config& config,
                 NetworkQualityMonitor::HintProvider hint = nullptr);
    ~UploadEngine();

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    /**
     * Register a file and start uploading it.
     * @param job_id receives the new job's id
     * @return false with IO_ERROR when the file cannot be used
     */
    bool start(const std::string& path, std::string& job_id, UploadError& err);

    bool pause(const std::string& job_id);

    /**
     * Continue a paused or failed job. new_path reselects the source file
     * (name and size must match). Jobs with a remote session are revalidated
     * with the coordinator first.
     */
    bool resume(const std::string& job_id, const std::string& new_path, UploadError& err);
    bool resume(const std::string& job_id);

    bool cancel(const std::string& job_id);

    bool status(const std::string& job_id, FileUploadJob& out) const;
    std::vector<FileUploadJob> jobs() const;

    /**
     * Block until the job's scheduler has stopped (any outcome).
     * @return false on timeout
     */
    bool wait_for_job(const std::string& job_id, std::chrono::milliseconds timeout);

    /**
     * Load a snapshot left by an earlier process (empty path: configured one).
     * @return true when it holds jobs that can be resumed
     */
    bool detect_interrupted_session(const std::string& snapshot_path = "");

    // Ids of paused/error jobs, oldest first
    std::vector<std::string> resumable_jobs() const;

    void set_listener(SessionState::Listener listener);

    // Pause every running job and stop the workers
    void shutdown();

    std::string transfer_id() const;
    NetworkQualityMonitor& monitor() { return m_monitor; }
    ConcurrencyGovernor& governor() { return m_governor; }
    const Config& config() const { return m_config; }

private:
    struct RunningJob;

    bool launch(const std::string& job_id);
    bool is_running_locked(const std::string& job_id) const;
    void ensure_measured();

    TransferCoordinator& m_coordinator;
    Config m_config;
    NetworkQualityMonitor m_monitor;
    ConcurrencyGovernor m_governor;
    RetryPolicy m_policy;
    UploadWorkerPool m_pool;

    mutable std::mutex m_session_mutex;
    std::unique_ptr<SessionState> m_session;
    SessionState::Listener m_listener;

    mutable std::mutex m_jobs_mutex;
    std::condition_variable m_done_cv;
    std::map<std::string, std::shared_ptr<RunningJob>> m_running;
    bool m_measured = false;
    bool m_shutdown = false;
};

#endif // UPLOAD_ENGINE_H
