#ifndef UPLOAD_SCHEDULER_H
#define UPLOAD_SCHEDULER_H

#include "upload_types.h"
#include <cstdint>
#include <string>

class TransferCoordinator;
class NetworkQualityMonitor;
class ConcurrencyGovernor;
class UploadWorkerPool;
class SessionState;
class RetryPolicy;
class JobControl;

/**
 * UPLOAD SCHEDULER
 *
 * Drives one job from its current state to completed, paused, cancelled
 * or error. run() blocks the calling (scheduler) thread; part uploads are
 * executed on the shared worker pool, never more than the governor allows.
 *
 * Multipart path:
 *   1. createUpload when the job has no upload id
 *   2. stage up to 2 x limit descriptors, skipping recorded parts
 *   3. read + dispatch while in-flight < limit
 *   4. record each accepted part (sorted) and persist the snapshot
 *   5. completeUpload with the sorted part list
 *
 * Files under the single-upload threshold take one putWhole call.
 */
class UploadScheduler {
public:
    struct Context {
        TransferCoordinator& coordinator;
        NetworkQualityMonitor& monitor;
        ConcurrencyGovernor& governor;
        UploadWorkerPool& pool;
        SessionState& state;
        const RetryPolicy& policy;
        JobControl& control;
        int64_t base_timeout_ms;
        bool low_resource_mode;
    };

    UploadScheduler(const Context& ctx, std::string job_id);

    JobStatus run();

    // Failure that moved the job to error (ok() otherwise)
    const UploadError& last_error() const { return m_error; }

    // Remote key used when the coordinator does not assign one
    static std::string default_remote_key(const std::string& job_id, const std::string& filename);

private:
    JobStatus run_single(const std::string& path, uint64_t size, std::string remote_key);
    JobStatus run_multipart();
    JobStatus finish_interrupted();
    JobStatus fail(const UploadError& error);
    bool ensure_remote_upload(std::string& upload_id, std::string& remote_key);

    Context m_ctx;
    std::string m_job_id;
    UploadError m_error;
};

#endif // UPLOAD_SCHEDULER_H
