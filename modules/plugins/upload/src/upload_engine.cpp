#include "upload_engine.h"
#include "chunk_upload_task.h"
#include "transfer_coordinator.h"
#include "upload_scheduler.h"
#include "config_manager.h"
#include "logger.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>
#include <thread>

namespace {

NetworkQualityMonitor::Config monitor_config(const UploadEngine::Config& c) {
    NetworkQualityMonitor::Config mc;
    mc.probe_timeout_ms = c.probe_timeout_ms;
    mc.default_bandwidth_mbps = c.default_bandwidth_mbps;
    mc.default_latency_ms = c.default_latency_ms;
    mc.single_upload_threshold = static_cast<uint64_t>(c.single_upload_threshold_mb * static_cast<double>(MIB));
    mc.success_window = c.success_window;
    return mc;
}

ConcurrencyGovernor::Config governor_config(const UploadEngine::Config& c) {
    ConcurrencyGovernor::Config gc;
    gc.low_resource_mode = c.low_resource_mode;
    gc.success_window = c.success_window;
    return gc;
}

RetryPolicy::Config retry_config(const UploadEngine::Config& c) {
    RetryPolicy::Config rc;
    rc.max_retries = c.max_retries;
    rc.base_delay_ms = c.base_retry_delay_ms;
    rc.low_resource_mode = c.low_resource_mode;
    return rc;
}

std::string generate_job_id() {
    static std::atomic<uint32_t> counter{0};
    std::random_device rd;
    std::ostringstream oss;
    oss << "job-" << std::hex << std::setfill('0') << std::setw(8) << rd()
        << "-" << std::dec << ++counter;
    return oss.str();
}

bool stat_file(const std::string& path, uint64_t& size, UploadError& err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.message = "Not a readable file: " + path;
        return false;
    }
    const auto bytes = std::filesystem::file_size(path, ec);
    if (ec) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.message = "Cannot stat " + path + ": " + ec.message();
        return false;
    }
    size = static_cast<uint64_t>(bytes);
    return true;
}

} // namespace

UploadEngine::Config UploadEngine::Config::from_config_manager() {
    ConfigManager& cfg = ConfigManager::getInstance();
    Config c;
    c.low_resource_mode = cfg.isLowResourceMode();
    c.single_upload_threshold_mb = cfg.getSingleUploadThresholdMb();
    c.max_retries = cfg.getMaxRetries();
    c.base_retry_delay_ms = cfg.getBaseRetryDelayMs();
    c.base_timeout_ms = cfg.getBaseTimeoutMs();
    c.snapshot_path = cfg.getSnapshotPath();
    c.snapshot_ttl_hours = cfg.getSnapshotTtlHours();
    c.probe_timeout_ms = cfg.getProbeTimeoutMs();
    c.default_bandwidth_mbps = cfg.getDefaultBandwidthMbps();
    c.default_latency_ms = cfg.getDefaultLatencyMs();
    c.success_window = cfg.getSuccessWindow();
    return c;
}

struct UploadEngine::RunningJob {
    JobControl control;
    std::thread thread;
    std::atomic<bool> done{false};
};

UploadEngine::UploadEngine(TransferCoordinator& coordinator, const Config& config,
                           NetworkQualityMonitor::HintProvider hint)
    : m_coordinator(coordinator),
      m_config(config),
      m_monitor(monitor_config(config), std::move(hint)),
      m_governor(m_monitor, governor_config(config)),
      m_policy(m_monitor, retry_config(config)),
      m_pool(config.low_resource_mode ? MAX_CONCURRENCY_LOW_RESOURCE : MAX_CONCURRENCY),
      m_session(std::make_unique<SessionState>(config.snapshot_path)) {
    LOG_INFO("UP: Engine ready (transfer " + m_session->transfer_id() + ", " +
             std::to_string(m_pool.worker_count()) + " workers" +
             (config.low_resource_mode ? ", low-resource mode)" : ")"));
}

UploadEngine::~UploadEngine() {
    shutdown();
}

// ============================================================================
// INTENTS
// ============================================================================

bool UploadEngine::start(const std::string& path, std::string& job_id, UploadError& err) {
    FileUploadJob job;
    if (!stat_file(path, job.size, err)) {
        LOG_WARN("UP: " + err.message);
        return false;
    }

    ensure_measured();

    job.id = generate_job_id();
    job.filename = std::filesystem::path(path).filename().string();
    job.local_path = path;
    job.status = JobStatus::PENDING;

    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        if (!m_session->add_job(job)) {
            err.kind = UploadErrorKind::VALIDATION_ERROR;
            err.message = "Could not register job for " + path;
            return false;
        }
    }

    LOG_INFO("UP: Job " + job.id + " created for " + job.filename + " (" + format_bytes(job.size) + ")");
    job_id = job.id;
    return launch(job.id);
}

bool UploadEngine::pause(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(m_jobs_mutex);
    auto it = m_running.find(job_id);
    if (it == m_running.end() || it->second->done) {
        LOG_DEBUG("UP: Pause ignored, job " + job_id + " is not running");
        return false;
    }
    it->second->control.request(UploadErrorKind::PAUSED);
    LOG_INFO("UP: Pause requested for job " + job_id);
    return true;
}

bool UploadEngine::resume(const std::string& job_id) {
    UploadError err;
    return resume(job_id, "", err);
}

bool UploadEngine::resume(const std::string& job_id, const std::string& new_path, UploadError& err) {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        if (is_running_locked(job_id)) {
            err.kind = UploadErrorKind::VALIDATION_ERROR;
            err.message = "Job " + job_id + " is already running";
            return false;
        }
    }

    SessionState* session;
    {
        std::lock_guard<std::mutex> lock(m_session_mutex);
        session = m_session.get();
    }

    FileUploadJob job;
    if (!session->get_job(job_id, job)) {
        err.kind = UploadErrorKind::VALIDATION_ERROR;
        err.message = "Unknown job " + job_id;
        return false;
    }
    if (job.status != JobStatus::PAUSED && job.status != JobStatus::ERROR) {
        err.kind = UploadErrorKind::VALIDATION_ERROR;
        err.message = "Job " + job_id + " is " + job_status_name(job.status) + ", nothing to resume";
        return false;
    }

    // File reselection: must be the same file
    const std::string path = new_path.empty() ? job.local_path : new_path;
    uint64_t size = 0;
    if (!stat_file(path, size, err)) {
        LOG_WARN("UP: Job " + job_id + " source unavailable: " + err.message);
        return false;
    }
    const std::string name = std::filesystem::path(path).filename().string();
    if (name != job.filename || size != job.size) {
        err.kind = UploadErrorKind::VALIDATION_ERROR;
        err.message = "Selected file does not match " + job.filename + " (" + format_bytes(job.size) + ")";
        LOG_WARN("UP: " + err.message);
        return false;
    }
    if (path != job.local_path) {
        session->set_local_path(job_id, path);
    }

    if (!job.upload_id.empty() || !job.completed_parts.empty()) {
        TransferValidation validation = m_coordinator.validate_still_open(session->transfer_id());
        if (!validation.valid) {
            const std::string message = "Cannot resume: " + validation.reason +
                                        ". Please start a fresh upload.";
            LOG_WARN("UP: Job " + job_id + " " + message);
            session->reset_remote_state(job_id);
            if (job.status == JobStatus::ERROR) {
                session->set_error_message(job_id, message);
            } else {
                session->transition(job_id, JobStatus::ERROR, message);
            }
            err.kind = UploadErrorKind::VALIDATION_ERROR;
            err.message = message;
            return false;
        }
    }

    ensure_measured();
    LOG_INFO("UP: Resuming job " + job_id + " with " + std::to_string(job.completed_parts.size()) +
             " parts already uploaded");
    return launch(job_id);
}

bool UploadEngine::cancel(const std::string& job_id) {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        auto it = m_running.find(job_id);
        if (it != m_running.end() && !it->second->done) {
            it->second->control.request(UploadErrorKind::CANCELLED);
            LOG_INFO("UP: Cancel requested for job " + job_id);
            return true;
        }
    }

    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_session->transition(job_id, JobStatus::CANCELLED);
}

// ============================================================================
// QUERIES
// ============================================================================

bool UploadEngine::status(const std::string& job_id, FileUploadJob& out) const {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_session->get_job(job_id, out);
}

std::vector<FileUploadJob> UploadEngine::jobs() const {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_session->jobs();
}

std::string UploadEngine::transfer_id() const {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_session->transfer_id();
}

std::vector<std::string> UploadEngine::resumable_jobs() const {
    std::vector<std::string> ids;
    for (const auto& job : jobs()) {
        if (job.status == JobStatus::PAUSED || job.status == JobStatus::ERROR) {
            ids.push_back(job.id);
        }
    }
    return ids;
}

bool UploadEngine::wait_for_job(const std::string& job_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(m_jobs_mutex);
    return m_done_cv.wait_for(lock, timeout, [this, &job_id] { return !is_running_locked(job_id); });
}

void UploadEngine::set_listener(SessionState::Listener listener) {
    std::lock_guard<std::mutex> lock(m_session_mutex);
    m_listener = listener;
    m_session->set_listener(std::move(listener));
}

// ============================================================================
// INTERRUPTED SESSIONS
// ============================================================================

bool UploadEngine::detect_interrupted_session(const std::string& snapshot_path) {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        for (const auto& kv : m_running) {
            if (!kv.second->done) {
                LOG_WARN("UP: Cannot load a snapshot while jobs are running");
                return false;
            }
        }
    }

    const std::string path = snapshot_path.empty() ? m_config.snapshot_path : snapshot_path;
    auto restored = std::make_unique<SessionState>(path);
    std::string error;
    if (!restored->load(m_config.snapshot_ttl_hours, error)) {
        LOG_DEBUG("UP: No interrupted session (" + error + ")");
        return false;
    }

    bool resumable = false;
    for (const auto& job : restored->jobs()) {
        if (job.status == JobStatus::PAUSED || job.status == JobStatus::ERROR) {
            resumable = true;
        }
    }
    if (!resumable) {
        LOG_DEBUG("UP: Snapshot " + path + " has nothing left to resume");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_session_mutex);
    restored->set_listener(m_listener);
    m_session = std::move(restored);
    // Rewrite so the snapshot reflects uploading -> paused
    m_session->save();
    LOG_INFO("UP: Interrupted session " + m_session->transfer_id() + " found in " + path);
    return true;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void UploadEngine::shutdown() {
    std::vector<std::shared_ptr<RunningJob>> running;
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        if (m_shutdown) return;
        m_shutdown = true;
        for (auto& kv : m_running) {
            if (!kv.second->done) {
                kv.second->control.request(UploadErrorKind::PAUSED);
            }
            running.push_back(kv.second);
        }
    }

    for (auto& job : running) {
        if (job->thread.joinable()) {
            job->thread.join();
        }
    }
    m_pool.shutdown(true);
    LOG_DEBUG("UP: Engine shut down");
}

bool UploadEngine::is_running_locked(const std::string& job_id) const {
    auto it = m_running.find(job_id);
    return it != m_running.end() && !it->second->done;
}

void UploadEngine::ensure_measured() {
    {
        std::lock_guard<std::mutex> lock(m_jobs_mutex);
        if (m_measured) return;
        m_measured = true;
    }
    m_monitor.measure();
}

bool UploadEngine::launch(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(m_jobs_mutex);
    if (m_shutdown) {
        LOG_WARN("UP: Engine is shut down, job " + job_id + " not started");
        return false;
    }

    auto it = m_running.find(job_id);
    if (it != m_running.end()) {
        if (!it->second->done) {
            LOG_WARN("UP: Job " + job_id + " already has a scheduler");
            return false;
        }
        if (it->second->thread.joinable()) {
            it->second->thread.join();
        }
        m_running.erase(it);
    }

    SessionState* session;
    {
        std::lock_guard<std::mutex> session_lock(m_session_mutex);
        session = m_session.get();
    }

    auto running = std::make_shared<RunningJob>();
    m_running[job_id] = running;

    UploadScheduler::Context ctx{m_coordinator, m_monitor, m_governor, m_pool, *session,
                                 m_policy, running->control, m_config.base_timeout_ms,
                                 m_config.low_resource_mode};
    running->thread = std::thread([this, ctx, job_id, running]() {
        UploadScheduler scheduler(ctx, job_id);
        const JobStatus result = scheduler.run();
        LOG_DEBUG("UP: Scheduler for job " + job_id + " exited (" + job_status_name(result) + ")");
        {
            std::lock_guard<std::mutex> guard(m_jobs_mutex);
            running->done = true;
        }
        m_done_cv.notify_all();
    });
    return true;
}
