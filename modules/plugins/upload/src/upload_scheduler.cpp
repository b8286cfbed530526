#include "upload_scheduler.h"
#include "chunk_source.h"
#include "chunk_upload_task.h"
#include "concurrency_governor.h"
#include "network_quality_monitor.h"
#include "progress_aggregator.h"
#include "retry_policy.h"
#include "session_state.h"
#include "transfer_coordinator.h"
#include "upload_worker_pool.h"
#include "logger.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <memory>
#include <mutex>

namespace {

// Completion bookkeeping shared between the scheduler thread and workers
struct DispatchState {
    std::mutex mutex;
    std::condition_variable cv;
    int in_flight = 0;
    uint64_t completions = 0;
    bool failed = false;
    UploadError failure;
};

bool read_whole_file(const std::string& path, uint64_t size, Chunk& out, UploadError& err) {
    ChunkLayout whole;
    whole.probe_size = size;
    whole.base_size = size;
    whole.probe_parts = 1;

    out.descriptor.part_number = 1;
    out.descriptor.offset = 0;
    out.descriptor.length = size;
    out.descriptor.is_final = true;
    if (size == 0) {
        out.data.clear();
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            err.kind = UploadErrorKind::IO_ERROR;
            err.message = "Cannot open source file " + path;
            return false;
        }
        return true;
    }

    ChunkSource source(path, size, whole);
    if (!source.open(err)) {
        return false;
    }
    return source.read(out.descriptor, out, err);
}

// Coordinator or listener code threw: the job fails instead of hanging
UploadError unexpected_failure(uint32_t part_number, const std::exception& e) {
    UploadError err;
    err.kind = UploadErrorKind::UPLOAD_FAILED;
    err.part_number = part_number;
    err.message = part_number == 0 ? std::string("Unexpected exception: ") + e.what()
                                   : "Part " + std::to_string(part_number) + " threw: " + e.what();
    return err;
}

// Holds a job's target in the shared governor while its parts are dispatched
class TargetRegistration {
public:
    TargetRegistration(ConcurrencyGovernor& governor, std::string job_id, int target)
        : m_governor(governor), m_job_id(std::move(job_id)) {
        m_governor.register_job(m_job_id, target);
    }
    ~TargetRegistration() { m_governor.unregister_job(m_job_id); }

    TargetRegistration(const TargetRegistration&) = delete;
    TargetRegistration& operator=(const TargetRegistration&) = delete;

private:
    ConcurrencyGovernor& m_governor;
    std::string m_job_id;
};

} // namespace

UploadScheduler::UploadScheduler(const Context& ctx, std::string job_id)
    : m_ctx(ctx), m_job_id(std::move(job_id)) {}

std::string UploadScheduler::default_remote_key(const std::string& job_id, const std::string& filename) {
    return job_id + "/" + filename;
}

JobStatus UploadScheduler::run() {
    FileUploadJob job;
    if (!m_ctx.state.get_job(m_job_id, job)) {
        m_error.kind = UploadErrorKind::VALIDATION_ERROR;
        m_error.message = "Unknown job " + m_job_id;
        LOG_ERROR("SCHED: " + m_error.message);
        return JobStatus::ERROR;
    }

    if (!m_ctx.state.transition(m_job_id, JobStatus::UPLOADING)) {
        return job.status;
    }

    try {
        if (!job.is_multipart() && job.upload_id.empty() && m_ctx.monitor.is_single_upload(job.size)) {
            std::string key = job.remote_key.empty() ? default_remote_key(job.id, job.filename)
                                                     : job.remote_key;
            return run_single(job.local_path, job.size, key);
        }
        return run_multipart();
    } catch (const std::exception& e) {
        return fail(unexpected_failure(0, e));
    }
}

// ============================================================================
// SINGLE UPLOAD
// ============================================================================

JobStatus UploadScheduler::run_single(const std::string& path, uint64_t size, std::string remote_key) {
    LOG_INFO("SCHED: Job " + m_job_id + " single upload of " + format_bytes(size) + " to " + remote_key);
    m_ctx.state.set_remote_upload(m_job_id, "", remote_key);

    Chunk chunk;
    UploadError err;
    if (!read_whole_file(path, size, chunk, err)) {
        return fail(err);
    }

    SessionState& state = m_ctx.state;
    const std::string job_id = m_job_id;
    ProgressAggregator progress(size, [&state, job_id](double pct) { state.set_progress(job_id, pct); });

    ChunkUploadTask::Context task_ctx{m_ctx.coordinator, m_ctx.monitor, m_ctx.governor, m_ctx.policy,
                                      progress, m_ctx.control, m_ctx.base_timeout_ms};
    ChunkUploadTask task(task_ctx, remote_key, "", ChunkUploadTask::Mode::WHOLE);

    CompletedPart ignored;
    if (!task.run(chunk, ignored, err)) {
        if (is_user_intent(err.kind)) {
            return finish_interrupted();
        }
        return fail(err);
    }

    progress.finish();
    m_ctx.state.transition(m_job_id, JobStatus::COMPLETED);
    LOG_INFO("SCHED: Job " + m_job_id + " completed (single upload)");
    return JobStatus::COMPLETED;
}

// ============================================================================
// MULTIPART UPLOAD
// ============================================================================

bool UploadScheduler::ensure_remote_upload(std::string& upload_id, std::string& remote_key) {
    FileUploadJob job;
    m_ctx.state.get_job(m_job_id, job);
    if (!job.upload_id.empty()) {
        upload_id = job.upload_id;
        remote_key = job.remote_key.empty() ? default_remote_key(job.id, job.filename) : job.remote_key;
        return true;
    }

    for (int attempt = 0; attempt < m_ctx.policy.max_attempts(); ++attempt) {
        RemoteUpload remote;
        CoordinatorResult result = m_ctx.coordinator.create_upload(job.id, job.filename, job.size, remote);
        UploadError err = ChunkUploadTask::classify(result, 0, m_ctx.control.intent(), false);
        if (err.ok() && remote.upload_id.empty()) {
            err.kind = UploadErrorKind::VALIDATION_ERROR;
            err.message = "Coordinator returned no upload id";
        }

        if (err.ok()) {
            upload_id = remote.upload_id;
            remote_key = remote.remote_key.empty() ? default_remote_key(job.id, job.filename)
                                                   : remote.remote_key;
            m_ctx.state.set_remote_upload(m_job_id, upload_id, remote_key);
            LOG_INFO("SCHED: Job " + m_job_id + " multipart session " + upload_id + " -> " + remote_key);
            return true;
        }

        if (!m_ctx.policy.should_retry(err.kind, attempt)) {
            m_error = err;
            if (is_retryable(err.kind)) {
                m_error.kind = UploadErrorKind::UPLOAD_FAILED;
                m_error.cause = err.kind;
                m_error.message = "createUpload failed: " + err.message;
            }
            return false;
        }
        const UploadErrorKind intent = m_ctx.control.wait_for(
            std::chrono::milliseconds(m_ctx.policy.delay_ms(err.kind, attempt)));
        if (intent != UploadErrorKind::NONE) {
            m_error = UploadError{};
            m_error.kind = intent;
            return false;
        }
    }
    return false;
}

JobStatus UploadScheduler::run_multipart() {
    std::string upload_id;
    std::string remote_key;
    if (!ensure_remote_upload(upload_id, remote_key)) {
        if (is_user_intent(m_error.kind)) {
            m_error = UploadError{};
            return finish_interrupted();
        }
        return fail(m_error);
    }

    FileUploadJob job;
    m_ctx.state.get_job(m_job_id, job);
    if (!job.layout.is_planned()) {
        job.layout = m_ctx.monitor.plan_layout(job.size);
        if (!job.layout.is_planned()) {
            // Monitor would single-upload this now, but a session is already open
            job.layout.probe_size = PROBE_PART_SIZE;
            job.layout.base_size = MIN_PART_SIZE;
            job.layout.probe_parts = PROBE_PARTS;
        }
        m_ctx.state.set_layout(m_job_id, job.layout);
    }

    ChunkSource source(job.local_path, job.size, job.layout);
    UploadError err;
    if (!source.open(err)) {
        return fail(err);
    }

    const uint32_t total = source.total_parts();
    TargetRegistration registration(m_ctx.governor, m_job_id,
                                    m_ctx.monitor.adaptive_concurrency(job.size, total, m_ctx.low_resource_mode));
    LOG_INFO("SCHED: Job " + m_job_id + " " + format_bytes(job.size) + " in " + std::to_string(total) +
             " parts (" + std::to_string(job.completed_parts.size()) + " already done), concurrency " +
             std::to_string(m_ctx.governor.current_concurrency()));

    SessionState& state = m_ctx.state;
    const std::string job_id = m_job_id;
    ProgressAggregator progress(job.size, [&state, job_id](double pct) { state.set_progress(job_id, pct); });
    progress.seed_completed(job.completed_bytes());

    ChunkUploadTask::Context task_ctx{m_ctx.coordinator, m_ctx.monitor, m_ctx.governor, m_ctx.policy,
                                      progress, m_ctx.control, m_ctx.base_timeout_ms};

    DispatchState dispatch;
    std::deque<ChunkDescriptor> staged;

    try {
        while (true) {
            if (m_ctx.control.stop_requested()) {
                break;
            }
            {
                std::lock_guard<std::mutex> lock(dispatch.mutex);
                if (dispatch.failed) break;
            }

            const int limit = std::max(1, m_ctx.governor.current_concurrency());

            // Look-ahead window
            while (staged.size() < static_cast<size_t>(2 * limit) && !source.exhausted()) {
                ChunkDescriptor descriptor;
                if (!source.next_descriptor(descriptor)) break;
                if (job.has_part(descriptor.part_number)) continue;
                staged.push_back(descriptor);
            }

            std::unique_lock<std::mutex> lock(dispatch.mutex);
            if (staged.empty() && dispatch.in_flight == 0) {
                break;
            }

            bool read_failed = false;
            while (dispatch.in_flight < limit && !staged.empty() && !dispatch.failed) {
                const ChunkDescriptor descriptor = staged.front();
                staged.pop_front();

                auto chunk = std::make_shared<Chunk>();
                lock.unlock();
                const bool read_ok = source.read(descriptor, *chunk, err);
                lock.lock();
                if (!read_ok) {
                    dispatch.failed = true;
                    dispatch.failure = err;
                    read_failed = true;
                    break;
                }

                auto work = [this, chunk, &dispatch, &task_ctx, upload_id, remote_key]() {
                    bool ok = false;
                    UploadError part_err;
                    try {
                        ChunkUploadTask task(task_ctx, remote_key, upload_id);
                        CompletedPart part;
                        ok = task.run(*chunk, part, part_err);
                        if (ok) {
                            m_ctx.state.record_part(m_job_id, part);
                        }
                    } catch (const std::exception& e) {
                        ok = false;
                        part_err = unexpected_failure(chunk->descriptor.part_number, e);
                        LOG_ERROR("SCHED: Job " + m_job_id + " " + part_err.message);
                    }

                    // Always reached: the scheduler waits for in_flight == 0
                    std::lock_guard<std::mutex> guard(dispatch.mutex);
                    --dispatch.in_flight;
                    ++dispatch.completions;
                    if (!ok && !is_user_intent(part_err.kind) && !dispatch.failed) {
                        dispatch.failed = true;
                        dispatch.failure = part_err;
                    }
                    dispatch.cv.notify_all();
                };
                // Workers decrement under dispatch.mutex, which is held here
                if (m_ctx.pool.submit(work)) {
                    ++dispatch.in_flight;
                } else {
                    dispatch.failed = true;
                    dispatch.failure.kind = UploadErrorKind::UPLOAD_FAILED;
                    dispatch.failure.part_number = descriptor.part_number;
                    dispatch.failure.message = "Worker pool is shut down";
                    break;
                }
            }
            if (read_failed) {
                LOG_ERROR("SCHED: Job " + m_job_id + " read failed, draining in-flight parts");
                break;
            }

            // Wake on completion; pause/cancel is picked up by the periodic check
            const uint64_t seen = dispatch.completions;
            dispatch.cv.wait_for(lock, std::chrono::milliseconds(100), [&dispatch, seen, limit, &staged] {
                return dispatch.completions != seen ||
                       (dispatch.in_flight < limit && !staged.empty());
            });
        }
    } catch (const std::exception& e) {
        // Workers may still hold references to this frame: record and drain
        std::lock_guard<std::mutex> lock(dispatch.mutex);
        if (!dispatch.failed) {
            dispatch.failed = true;
            dispatch.failure = unexpected_failure(0, e);
        }
        LOG_ERROR("SCHED: Job " + m_job_id + " dispatch aborted: " + e.what());
    }

    // Let in-flight parts finish (or abort, on pause/cancel); their successes are kept
    {
        std::unique_lock<std::mutex> lock(dispatch.mutex);
        dispatch.cv.wait(lock, [&dispatch] { return dispatch.in_flight == 0; });
    }

    if (m_ctx.control.stop_requested()) {
        return finish_interrupted();
    }
    if (dispatch.failed) {
        return fail(dispatch.failure);
    }

    m_ctx.state.get_job(m_job_id, job);
    if (job.completed_parts.size() != total) {
        UploadError missing;
        missing.kind = UploadErrorKind::UPLOAD_FAILED;
        missing.message = "Only " + std::to_string(job.completed_parts.size()) + " of " +
                          std::to_string(total) + " parts were accepted";
        return fail(missing);
    }

    // completed_parts is kept sorted by SessionState
    CoordinatorResult result = m_ctx.coordinator.complete_upload(remote_key, upload_id, job.completed_parts);
    UploadError complete_err = ChunkUploadTask::classify(result, 0, UploadErrorKind::NONE, false);
    if (!complete_err.ok()) {
        complete_err.message = "completeUpload failed: " + complete_err.message;
        return fail(complete_err);
    }

    progress.finish();
    m_ctx.state.transition(m_job_id, JobStatus::COMPLETED);
    LOG_INFO("SCHED: Job " + m_job_id + " completed, " + std::to_string(total) + " parts assembled");
    return JobStatus::COMPLETED;
}

// ============================================================================
// TERMINATION
// ============================================================================

JobStatus UploadScheduler::finish_interrupted() {
    if (m_ctx.control.intent() == UploadErrorKind::CANCELLED) {
        m_ctx.state.transition(m_job_id, JobStatus::CANCELLED);
        LOG_INFO("SCHED: Job " + m_job_id + " cancelled");
        return JobStatus::CANCELLED;
    }
    m_ctx.state.transition(m_job_id, JobStatus::PAUSED);
    LOG_INFO("SCHED: Job " + m_job_id + " paused");
    return JobStatus::PAUSED;
}

JobStatus UploadScheduler::fail(const UploadError& error) {
    m_error = error;
    LOG_ERROR("SCHED: Job " + m_job_id + " failed: " + error_kind_name(error.kind) +
              (error.message.empty() ? "" : " (" + error.message + ")"));
    m_ctx.state.transition(m_job_id, JobStatus::ERROR, user_facing_message(error));
    return JobStatus::ERROR;
}
