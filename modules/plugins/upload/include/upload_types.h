#ifndef UPLOAD_TYPES_H
#define UPLOAD_TYPES_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * UPLOAD TYPES AND COMMON DEFINITIONS
 *
 * Shared enums and structures used by the monitor, the scheduler, the
 * session state and the coordinator boundary.
 */

// ============================================================================
// ENUMS
// ============================================================================

enum class QualityTier {
    EXCELLENT,      // >= 50 Mbps and < 50 ms
    GOOD,           // >= 25 Mbps and < 100 ms
    FAIR,           // >= 10 Mbps and < 200 ms
    POOR,           // >= 1 Mbps and < 500 ms
    UNSTABLE        // anything worse
};

enum class JobStatus {
    PENDING,        // Selected, nothing dispatched yet
    UPLOADING,      // Scheduler running
    PAUSED,         // Paused by user or interrupted process
    COMPLETED,      // Remote object assembled
    ERROR,          // Unrecoverable failure, retry possible
    CANCELLED       // Discarded by user (terminal)
};

enum class UploadErrorKind {
    NONE,
    NETWORK_ERROR,      // transient, retryable
    TIMEOUT,            // transient, retryable
    SERVER_ERROR,       // 5xx / connection abort / connection lost; retryable, feeds the breaker
    VALIDATION_ERROR,   // malformed coordinator response, not retried
    PAUSED,             // user intent, not an error
    CANCELLED,          // user intent, not an error
    IO_ERROR,           // local file unreadable, needs reselection
    UPLOAD_FAILED       // retries exhausted for one part
};

// ============================================================================
// CONSTANTS
// ============================================================================

constexpr uint64_t KIB = 1024ULL;
constexpr uint64_t MIB = 1024ULL * KIB;
constexpr uint64_t GIB = 1024ULL * MIB;

constexpr uint64_t MIN_PART_SIZE = 5 * MIB;             // coordinator multipart minimum
constexpr uint64_t MAX_PART_SIZE = 50 * MIB;            // coordinator multipart maximum
constexpr uint64_t PROBE_PART_SIZE = 5 * MIB;           // first parts probe the network
constexpr uint32_t PROBE_PARTS = 3;
constexpr uint32_t SAMPLE_WINDOW = 10;                  // rolling bandwidth samples
constexpr int MAX_CONCURRENCY = 12;
constexpr int MAX_CONCURRENCY_LOW_RESOURCE = 4;
constexpr int DEFAULT_MAX_RETRIES = 3;
constexpr int DEFAULT_BASE_RETRY_DELAY_MS = 1000;
constexpr int DEFAULT_BASE_TIMEOUT_MS = 60000;
constexpr int MAX_TIMEOUT_MS = 180000;

// ============================================================================
// STRUCTURES
// ============================================================================

struct CompletedPart {
    uint32_t part_number = 0;
    std::string etag;
};

/**
 * Deterministic mapping from part number to byte range.
 * Parts 1..probe_parts are probe_size long, later parts base_size long,
 * the final part holds the remainder. Fixed once a job is planned.
 */
struct ChunkLayout {
    uint64_t probe_size = 0;
    uint64_t base_size = 0;
    uint32_t probe_parts = PROBE_PARTS;

    bool is_planned() const { return probe_size > 0 && base_size > 0; }

    uint64_t offset_of(uint32_t part_number) const;
    uint64_t length_of(uint32_t part_number, uint64_t file_size) const;
    uint32_t total_parts(uint64_t file_size) const;
};

struct ChunkDescriptor {
    uint32_t part_number = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    bool is_final = false;
};

struct Chunk {
    ChunkDescriptor descriptor;
    std::vector<uint8_t> data;
};

/**
 * Error value carried through results (no exceptions across the pipeline).
 */
struct UploadError {
    UploadErrorKind kind = UploadErrorKind::NONE;
    uint32_t part_number = 0;
    int status = 0;                 // HTTP-like status for SERVER_ERROR
    UploadErrorKind cause = UploadErrorKind::NONE;  // last attempt's kind for UPLOAD_FAILED
    std::string message;

    bool ok() const { return kind == UploadErrorKind::NONE; }
};

struct NetworkSample {
    double bandwidth_mbps = 0.0;
    double latency_ms = 0.0;
};

// ============================================================================
// HELPERS
// ============================================================================

const char* quality_tier_name(QualityTier tier);
const char* job_status_name(JobStatus status);
bool parse_job_status(const std::string& text, JobStatus& out);
const char* error_kind_name(UploadErrorKind kind);

// Pause and cancel are user intents and never surface as failures
bool is_user_intent(UploadErrorKind kind);
bool is_retryable(UploadErrorKind kind);

// Message suitable for the end user; pause/cancel yield an empty string
std::string user_facing_message(const UploadError& error);

std::string format_bytes(uint64_t bytes);

#endif // UPLOAD_TYPES_H
