#include "chunk_upload_task.h"
#include "concurrency_governor.h"
#include "network_quality_monitor.h"
#include "progress_aggregator.h"
#include "retry_policy.h"
#include "logger.h"

#include <algorithm>

// ============================================================================
// JOB CONTROL
// ============================================================================

void JobControl::request(UploadErrorKind intent) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Cancel wins over pause
        if (m_intent.load() != UploadErrorKind::CANCELLED) {
            m_intent.store(intent);
        }
    }
    m_cv.notify_all();
}

void JobControl::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_intent.store(UploadErrorKind::NONE);
}

UploadErrorKind JobControl::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cv.wait_for(lock, delay, [this] { return m_intent.load() != UploadErrorKind::NONE; });
    return m_intent.load();
}

// ============================================================================
// CHUNK UPLOAD TASK
// ============================================================================

ChunkUploadTask::ChunkUploadTask(const Context& ctx, std::string remote_key,
                                 std::string upload_id, Mode mode)
    : m_ctx(ctx),
      m_remote_key(std::move(remote_key)),
      m_upload_id(std::move(upload_id)),
      m_mode(mode) {}

bool ChunkUploadTask::run(const Chunk& chunk, CompletedPart& out, UploadError& err) {
    const uint32_t part = chunk.descriptor.part_number;
    UploadError last;

    for (int i = 0; i < m_ctx.policy.max_attempts(); ++i) {
        if (m_ctx.control.stop_requested()) {
            err = UploadError{};
            err.kind = m_ctx.control.intent();
            err.part_number = part;
            return false;
        }

        ++m_attempts;
        last = UploadError{};
        if (attempt(chunk, i, out, last)) {
            return true;
        }

        if (is_user_intent(last.kind) || !is_retryable(last.kind)) {
            err = last;
            return false;
        }

        if (!m_ctx.policy.should_retry(last.kind, i)) {
            break;
        }

        const int64_t delay = m_ctx.policy.delay_ms(last.kind, i);
        LOG_WARN("UP: Part " + std::to_string(part) + " attempt " + std::to_string(i + 1) +
                 " failed (" + error_kind_name(last.kind) + ": " + last.message +
                 "), retrying in " + std::to_string(delay) + " ms");

        const UploadErrorKind intent = m_ctx.control.wait_for(std::chrono::milliseconds(delay));
        if (intent != UploadErrorKind::NONE) {
            err = UploadError{};
            err.kind = intent;
            err.part_number = part;
            return false;
        }
    }

    err = UploadError{};
    err.kind = UploadErrorKind::UPLOAD_FAILED;
    err.part_number = part;
    err.cause = last.kind;
    err.status = last.status;
    err.message = "Part " + std::to_string(part) + " failed after " +
                  std::to_string(m_attempts) + " attempts: " + last.message;
    LOG_ERROR("UP: " + err.message);
    return false;
}

bool ChunkUploadTask::attempt(const Chunk& chunk, int attempt_index, CompletedPart& out,
                              UploadError& err) {
    using Clock = std::chrono::steady_clock;

    const uint32_t part = chunk.descriptor.part_number;
    const int64_t timeout_ms = m_ctx.monitor.adaptive_timeout_ms(
        m_ctx.base_timeout_ms, m_mode == Mode::WHOLE ? 1 : part);
    const auto started = Clock::now();
    const auto deadline = started + std::chrono::milliseconds(timeout_ms);

    JobControl& control = m_ctx.control;
    auto should_abort = [&control, deadline]() {
        return control.stop_requested() || Clock::now() >= deadline;
    };

    ProgressAggregator& progress = m_ctx.progress;
    std::size_t reported = 0;
    auto on_progress = [&progress, &reported, part](std::size_t done, std::size_t /*total*/) {
        if (done > reported) {
            progress.on_bytes(part, done - reported);
            reported = done;
        }
    };

    LOG_DEBUG("UP: Part " + std::to_string(part) + " attempt " + std::to_string(attempt_index + 1) +
              ", " + format_bytes(chunk.data.size()) + ", timeout " + std::to_string(timeout_ms) + " ms");

    CoordinatorResult result;
    if (m_mode == Mode::WHOLE) {
        result = m_ctx.coordinator.put_whole(m_remote_key, chunk.data, on_progress, should_abort);
    } else {
        result = m_ctx.coordinator.upload_part(m_remote_key, m_upload_id, part, chunk.data,
                                               on_progress, should_abort);
    }
    const auto elapsed = Clock::now() - started;

    err = classify(result, part, control.intent(), Clock::now() >= deadline);
    if (m_mode == Mode::PART && err.ok() && result.etag.empty()) {
        err.kind = UploadErrorKind::VALIDATION_ERROR;
        err.part_number = part;
        err.message = "Coordinator accepted part " + std::to_string(part) + " without an etag";
    }

    if (!err.ok()) {
        progress.on_part_aborted(part);
        if (err.kind == UploadErrorKind::SERVER_ERROR) {
            m_ctx.governor.on_server_error();
        } else if (!is_user_intent(err.kind)) {
            m_ctx.governor.on_failure();
        }
        return false;
    }

    const double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0.0 && !chunk.data.empty()) {
        const double mbps = static_cast<double>(chunk.data.size()) * 8.0 / seconds / 1e6;
        m_ctx.monitor.record_sample(mbps);
    }
    m_ctx.governor.on_success();
    progress.on_part_complete(part, chunk.data.size());

    out.part_number = part;
    out.etag = result.etag;
    return true;
}

UploadError ChunkUploadTask::classify(const CoordinatorResult& result, uint32_t part_number,
                                      UploadErrorKind intent, bool deadline_passed) {
    UploadError err;
    err.part_number = part_number;
    err.status = result.status;
    err.message = result.message;

    switch (result.outcome) {
        case CoordinatorOutcome::OK:
            err.status = 0;
            err.message.clear();
            break;
        case CoordinatorOutcome::NETWORK_ERROR:
            err.kind = UploadErrorKind::NETWORK_ERROR;
            break;
        case CoordinatorOutcome::CONNECTION_LOST:
        case CoordinatorOutcome::SERVER_ERROR:
            err.kind = UploadErrorKind::SERVER_ERROR;
            break;
        case CoordinatorOutcome::REJECTED:
            if (result.status == 408) {
                err.kind = UploadErrorKind::TIMEOUT;
            } else if (result.status == 429) {
                err.kind = UploadErrorKind::SERVER_ERROR;
            } else {
                err.kind = UploadErrorKind::VALIDATION_ERROR;
            }
            break;
        case CoordinatorOutcome::INVALID_RESPONSE:
            err.kind = UploadErrorKind::VALIDATION_ERROR;
            break;
        case CoordinatorOutcome::ABORTED:
            if (is_user_intent(intent)) {
                err.kind = intent;
            } else if (deadline_passed) {
                err.kind = UploadErrorKind::TIMEOUT;
                err.message = "Request timed out";
            } else {
                err.kind = UploadErrorKind::NETWORK_ERROR;
            }
            break;
    }

    if (!err.ok() && err.message.empty()) {
        err.message = error_kind_name(err.kind);
    }
    return err;
}
