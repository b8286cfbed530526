#include "upload_types.h"

#include <cstdio>

uint64_t ChunkLayout::offset_of(uint32_t part_number) const {
    if (part_number == 0) return 0;
    if (part_number <= probe_parts) {
        return static_cast<uint64_t>(part_number - 1) * probe_size;
    }
    return static_cast<uint64_t>(probe_parts) * probe_size +
           static_cast<uint64_t>(part_number - 1 - probe_parts) * base_size;
}

uint64_t ChunkLayout::length_of(uint32_t part_number, uint64_t file_size) const {
    if (part_number == 0) return 0;
    const uint64_t start = offset_of(part_number);
    if (start >= file_size) return 0;
    const uint64_t nominal = part_number <= probe_parts ? probe_size : base_size;
    const uint64_t remaining = file_size - start;
    return remaining < nominal ? remaining : nominal;
}

uint32_t ChunkLayout::total_parts(uint64_t file_size) const {
    if (!is_planned() || file_size == 0) return 0;
    const uint64_t probe_region = static_cast<uint64_t>(probe_parts) * probe_size;
    if (file_size <= probe_region) {
        return static_cast<uint32_t>((file_size + probe_size - 1) / probe_size);
    }
    const uint64_t rest = file_size - probe_region;
    return probe_parts + static_cast<uint32_t>((rest + base_size - 1) / base_size);
}

const char* quality_tier_name(QualityTier tier) {
    switch (tier) {
        case QualityTier::EXCELLENT: return "excellent";
        case QualityTier::GOOD: return "good";
        case QualityTier::FAIR: return "fair";
        case QualityTier::POOR: return "poor";
        case QualityTier::UNSTABLE: return "unstable";
    }
    return "unknown";
}

const char* job_status_name(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::UPLOADING: return "uploading";
        case JobStatus::PAUSED: return "paused";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::ERROR: return "error";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

bool parse_job_status(const std::string& text, JobStatus& out) {
    static const JobStatus all[] = {JobStatus::PENDING, JobStatus::UPLOADING, JobStatus::PAUSED,
                                    JobStatus::COMPLETED, JobStatus::ERROR, JobStatus::CANCELLED};
    for (JobStatus s : all) {
        if (text == job_status_name(s)) {
            out = s;
            return true;
        }
    }
    return false;
}

const char* error_kind_name(UploadErrorKind kind) {
    switch (kind) {
        case UploadErrorKind::NONE: return "none";
        case UploadErrorKind::NETWORK_ERROR: return "network_error";
        case UploadErrorKind::TIMEOUT: return "timeout";
        case UploadErrorKind::SERVER_ERROR: return "server_error";
        case UploadErrorKind::VALIDATION_ERROR: return "validation_error";
        case UploadErrorKind::PAUSED: return "paused";
        case UploadErrorKind::CANCELLED: return "cancelled";
        case UploadErrorKind::IO_ERROR: return "io_error";
        case UploadErrorKind::UPLOAD_FAILED: return "upload_failed";
    }
    return "unknown";
}

bool is_user_intent(UploadErrorKind kind) {
    return kind == UploadErrorKind::PAUSED || kind == UploadErrorKind::CANCELLED;
}

bool is_retryable(UploadErrorKind kind) {
    return kind == UploadErrorKind::NETWORK_ERROR ||
           kind == UploadErrorKind::TIMEOUT ||
           kind == UploadErrorKind::SERVER_ERROR;
}

std::string user_facing_message(const UploadError& error) {
    UploadErrorKind kind = error.kind;
    if (kind == UploadErrorKind::UPLOAD_FAILED) {
        if (error.cause == UploadErrorKind::SERVER_ERROR) {
            return "Server temporarily overloaded. Click retry to continue.";
        }
        return "Upload temporarily failed. Click retry to continue.";
    }

    switch (kind) {
        case UploadErrorKind::NONE:
        case UploadErrorKind::PAUSED:
        case UploadErrorKind::CANCELLED:
            return "";
        case UploadErrorKind::SERVER_ERROR:
            return "Server temporarily overloaded. Click retry to continue.";
        case UploadErrorKind::NETWORK_ERROR:
        case UploadErrorKind::TIMEOUT:
            return "Connection interrupted. Check your internet and retry.";
        case UploadErrorKind::IO_ERROR:
            return "Source file is no longer readable. Please reselect the file.";
        default:
            return "Upload error occurred. Click retry to continue.";
    }
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), unit == 0 ? "%.0f %s" : "%.2f %s", value, units[unit]);
    return buf;
}
