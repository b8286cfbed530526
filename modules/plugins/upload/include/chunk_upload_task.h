#ifndef CHUNK_UPLOAD_TASK_H
#define CHUNK_UPLOAD_TASK_H

#include "upload_types.h"
#include "transfer_coordinator.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

class NetworkQualityMonitor;
class ConcurrencyGovernor;
class RetryPolicy;
class ProgressAggregator;

/**
 * Per-job control block. pause()/cancel() wake every retry wait and make
 * the coordinator's abort callback fire for in-flight requests.
 */
class JobControl {
public:
    void request(UploadErrorKind intent);   // PAUSED or CANCELLED
    void clear();
    UploadErrorKind intent() const { return m_intent.load(); }
    bool stop_requested() const { return m_intent.load() != UploadErrorKind::NONE; }

    /**
     * Sleep up to delay, returning early on pause/cancel.
     * @return the pending intent, NONE if the full delay elapsed
     */
    UploadErrorKind wait_for(std::chrono::milliseconds delay);

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::atomic<UploadErrorKind> m_intent{UploadErrorKind::NONE};
};

/**
 * Uploads one chunk: one coordinator call per attempt, bounded by the
 * adaptive timeout, retried with the shared RetryPolicy.
 */
class ChunkUploadTask {
public:
    enum class Mode {
        PART,       // uploadPart of a multipart session
        WHOLE       // putWhole for files under the single-upload threshold
    };

    struct Context {
        TransferCoordinator& coordinator;
        NetworkQualityMonitor& monitor;
        ConcurrencyGovernor& governor;
        const RetryPolicy& policy;
        ProgressAggregator& progress;
        JobControl& control;
        int64_t base_timeout_ms;
    };

    ChunkUploadTask(const Context& ctx, std::string remote_key, std::string upload_id,
                    Mode mode = Mode::PART);

    /**
     * Upload the chunk.
     * @param out etag of the accepted part (PART mode)
     * @param err PAUSED/CANCELLED, VALIDATION_ERROR, IO_ERROR, or
     *            UPLOAD_FAILED with the last attempt's kind in err.cause
     */
    bool run(const Chunk& chunk, CompletedPart& out, UploadError& err);

    int attempts() const { return m_attempts; }

    // Maps a coordinator answer to the error taxonomy (NONE on success)
    static UploadError classify(const CoordinatorResult& result, uint32_t part_number,
                                UploadErrorKind intent, bool deadline_passed);

private:
    bool attempt(const Chunk& chunk, int attempt_index, CompletedPart& out, UploadError& err);

    Context m_ctx;
    std::string m_remote_key;
    std::string m_upload_id;
    Mode m_mode;
    int m_attempts = 0;
};

#endif // CHUNK_UPLOAD_TASK_H
