#include "session_state.h"
#include "logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

using json = nlohmann::json;

namespace {

constexpr int SNAPSHOT_VERSION = 1;

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string generate_transfer_id() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << gen();
    return oss.str();
}

json job_to_json(const FileUploadJob& job) {
    json j;
    j["filename"] = job.filename;
    j["local_path"] = job.local_path;
    j["size"] = job.size;
    j["remote_key"] = job.remote_key;
    j["upload_id"] = job.upload_id;
    j["layout"] = {
        {"probe_size", job.layout.probe_size},
        {"base_size", job.layout.base_size},
        {"probe_parts", job.layout.probe_parts},
    };
    j["completed_parts"] = json::array();
    for (const auto& part : job.completed_parts) {
        j["completed_parts"].push_back({{"part_number", part.part_number}, {"etag", part.etag}});
    }
    j["current_part"] = job.current_part;
    j["status"] = job_status_name(job.status);
    j["error_message"] = job.error_message;
    return j;
}

bool job_from_json(const std::string& id, const json& j, FileUploadJob& job) {
    if (!j.is_object()) return false;

    job.id = id;
    job.filename = j.value("filename", "");
    job.local_path = j.value("local_path", "");
    job.size = j.value("size", static_cast<uint64_t>(0));
    job.remote_key = j.value("remote_key", "");
    job.upload_id = j.value("upload_id", "");
    if (j.contains("layout") && j["layout"].is_object()) {
        const json& l = j["layout"];
        job.layout.probe_size = l.value("probe_size", static_cast<uint64_t>(0));
        job.layout.base_size = l.value("base_size", static_cast<uint64_t>(0));
        job.layout.probe_parts = l.value("probe_parts", PROBE_PARTS);
    }
    if (j.contains("completed_parts") && j["completed_parts"].is_array()) {
        for (const auto& p : j["completed_parts"]) {
            CompletedPart part;
            part.part_number = p.value("part_number", 0u);
            part.etag = p.value("etag", "");
            if (part.part_number > 0 && !part.etag.empty()) {
                job.insert_part(part);
            }
        }
    }
    job.current_part = j.value("current_part", 0u);
    job.error_message = j.value("error_message", "");

    if (!parse_job_status(j.value("status", ""), job.status)) {
        LOG_WARN("STATE: Job " + id + " has unknown status, treating as paused");
        job.status = JobStatus::PAUSED;
    }
    return !job.filename.empty() && job.size > 0;
}

} // namespace

// ============================================================================
// FILE UPLOAD JOB
// ============================================================================

bool FileUploadJob::has_part(uint32_t part_number) const {
    auto it = std::lower_bound(completed_parts.begin(), completed_parts.end(), part_number,
                               [](const CompletedPart& p, uint32_t n) { return p.part_number < n; });
    return it != completed_parts.end() && it->part_number == part_number;
}

uint64_t FileUploadJob::completed_bytes() const {
    if (!is_multipart()) {
        return status == JobStatus::COMPLETED ? size : 0;
    }
    uint64_t bytes = 0;
    for (const auto& part : completed_parts) {
        bytes += layout.length_of(part.part_number, size);
    }
    return bytes;
}

int FileUploadJob::progress_percent() const {
    if (status == JobStatus::COMPLETED) {
        return 100;
    }
    const int whole = static_cast<int>(std::floor(progress));
    return std::max(0, std::min(99, whole));
}

bool FileUploadJob::insert_part(const CompletedPart& part) {
    auto it = std::lower_bound(completed_parts.begin(), completed_parts.end(), part.part_number,
                               [](const CompletedPart& p, uint32_t n) { return p.part_number < n; });
    if (it != completed_parts.end() && it->part_number == part.part_number) {
        return false;
    }
    completed_parts.insert(it, part);
    return true;
}

// ============================================================================
// SESSION STATE
// ============================================================================

SessionState::SessionState(std::string snapshot_path, std::string transfer_id)
    : m_snapshot_path(std::move(snapshot_path)),
      m_transfer_id(transfer_id.empty() ? generate_transfer_id() : std::move(transfer_id)) {}

std::string SessionState::transfer_id() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_transfer_id;
}

void SessionState::set_transfer_id(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_transfer_id = transfer_id;
}

void SessionState::set_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

bool SessionState::add_job(const FileUploadJob& job) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (job.id.empty() || m_jobs.count(job.id)) {
            LOG_WARN("STATE: Refusing to add job with empty or duplicate id '" + job.id + "'");
            return false;
        }
        m_jobs[job.id] = job;
        persist_locked();
    }
    notify(job);
    return true;
}

bool SessionState::get_job(const std::string& id, FileUploadJob& out) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    out = it->second;
    return true;
}

bool SessionState::has_job(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs.count(id) > 0;
}

std::vector<FileUploadJob> SessionState::jobs() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<FileUploadJob> out;
    out.reserve(m_jobs.size());
    for (const auto& kv : m_jobs) {
        out.push_back(kv.second);
    }
    return out;
}

bool SessionState::is_valid_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::PENDING:
            return to == JobStatus::UPLOADING || to == JobStatus::CANCELLED;
        case JobStatus::UPLOADING:
            return to == JobStatus::COMPLETED || to == JobStatus::PAUSED ||
                   to == JobStatus::ERROR || to == JobStatus::CANCELLED;
        case JobStatus::PAUSED:
            return to == JobStatus::UPLOADING || to == JobStatus::ERROR ||
                   to == JobStatus::CANCELLED;
        case JobStatus::ERROR:
            return to == JobStatus::UPLOADING || to == JobStatus::CANCELLED;
        case JobStatus::COMPLETED:
        case JobStatus::CANCELLED:
            return false;
    }
    return false;
}

bool SessionState::transition(const std::string& id, JobStatus to, const std::string& error_message) {
    FileUploadJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end()) {
            LOG_WARN("STATE: Transition for unknown job " + id);
            return false;
        }
        FileUploadJob& job = it->second;
        if (!is_valid_transition(job.status, to)) {
            LOG_WARN("STATE: Rejected transition " + std::string(job_status_name(job.status)) +
                     " -> " + job_status_name(to) + " for job " + id);
            return false;
        }

        LOG_INFO("STATE: Job " + id + " " + job_status_name(job.status) + " -> " + job_status_name(to));
        job.status = to;
        job.error_message = to == JobStatus::ERROR ? error_message : std::string();
        if (to == JobStatus::COMPLETED) {
            job.progress = 100.0;
        } else if (to == JobStatus::CANCELLED) {
            job.completed_parts.clear();
            job.current_part = 0;
        }
        persist_locked();
        snapshot = job;
    }
    notify(snapshot);
    return true;
}

bool SessionState::record_part(const std::string& id, const CompletedPart& part) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;

    FileUploadJob& job = it->second;
    if (!job.insert_part(part)) {
        LOG_DEBUG("STATE: Part " + std::to_string(part.part_number) + " of job " + id +
                  " already recorded");
        return false;
    }
    job.current_part = part.part_number;
    persist_locked();
    return true;
}

bool SessionState::set_remote_upload(const std::string& id, const std::string& upload_id,
                                     const std::string& remote_key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    it->second.upload_id = upload_id;
    it->second.remote_key = remote_key;
    persist_locked();
    return true;
}

bool SessionState::set_layout(const std::string& id, const ChunkLayout& layout) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    if (!it->second.completed_parts.empty()) {
        LOG_WARN("STATE: Layout of job " + id + " is fixed once parts exist");
        return false;
    }
    it->second.layout = layout;
    persist_locked();
    return true;
}

bool SessionState::set_local_path(const std::string& id, const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    it->second.local_path = path;
    return true;
}

void SessionState::set_progress(const std::string& id, double percent) {
    FileUploadJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end()) return;
        if (percent <= it->second.progress) return;
        it->second.progress = std::min(100.0, percent);
        snapshot = it->second;
    }
    notify(snapshot);
}

bool SessionState::set_error_message(const std::string& id, const std::string& message) {
    FileUploadJob snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_jobs.find(id);
        if (it == m_jobs.end() || it->second.status != JobStatus::ERROR) return false;
        it->second.error_message = message;
        persist_locked();
        snapshot = it->second;
    }
    notify(snapshot);
    return true;
}

bool SessionState::reset_remote_state(const std::string& id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_jobs.find(id);
    if (it == m_jobs.end()) return false;
    FileUploadJob& job = it->second;
    job.upload_id.clear();
    job.remote_key.clear();
    job.completed_parts.clear();
    job.current_part = 0;
    job.layout = ChunkLayout{};
    job.progress = 0.0;
    persist_locked();
    return true;
}

bool SessionState::all_finished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return all_finished_locked();
}

bool SessionState::all_finished_locked() const {
    for (const auto& kv : m_jobs) {
        if (kv.second.status != JobStatus::COMPLETED && kv.second.status != JobStatus::CANCELLED) {
            return false;
        }
    }
    return true;
}

void SessionState::notify(const FileUploadJob& job) {
    Listener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listener = m_listener;
    }
    if (!listener) {
        return;
    }
    // Runs on worker threads; listener exceptions stop here
    try {
        listener(job);
    } catch (const std::exception& e) {
        LOG_WARN("STATE: Listener failed for job " + job.id + ": " + e.what());
    }
}

// ============================================================================
// SNAPSHOT
// ============================================================================

bool SessionState::save() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return save_locked();
}

void SessionState::clear_snapshot() {
    if (m_snapshot_path.empty()) return;
    if (std::remove(m_snapshot_path.c_str()) == 0) {
        LOG_DEBUG("STATE: Removed snapshot " + m_snapshot_path);
    }
}

void SessionState::persist_locked() {
    if (!m_jobs.empty() && all_finished_locked()) {
        clear_snapshot();
        return;
    }
    save_locked();
}

bool SessionState::save_locked() {
    // Called with mutex held
    if (m_snapshot_path.empty()) {
        return true;
    }

    std::string tmp_path = m_snapshot_path + ".tmp";

    try {
        json j;
        j["version"] = SNAPSHOT_VERSION;
        j["transfer_id"] = m_transfer_id;
        j["saved_at"] = now_ms();
        j["jobs"] = json::object();
        for (const auto& kv : m_jobs) {
            j["jobs"][kv.first] = job_to_json(kv.second);
        }

        std::ofstream ofs(tmp_path);
        if (!ofs.is_open()) {
            LOG_ERROR("STATE: Cannot write temp file " + tmp_path);
            return false;
        }

        ofs << j.dump(2);
        ofs.close();

        if (ofs.fail()) {
            LOG_ERROR("STATE: Failed to write temp file " + tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        // Atomic rename
        if (std::rename(tmp_path.c_str(), m_snapshot_path.c_str()) != 0) {
            LOG_ERROR("STATE: Failed to rename temp file to " + m_snapshot_path);
            std::remove(tmp_path.c_str());
            return false;
        }
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("STATE: Exception during save: " + std::string(e.what()));
        std::remove(tmp_path.c_str());
        return false;
    }
}

bool SessionState::load(int ttl_hours, std::string& error) {
    std::ifstream ifs(m_snapshot_path);
    if (!ifs.is_open()) {
        error = "No snapshot at " + m_snapshot_path;
        LOG_DEBUG("STATE: " + error);
        return false;
    }

    std::map<std::string, FileUploadJob> loaded;
    std::string transfer_id;

    try {
        json j;
        ifs >> j;

        if (!j.is_object() || !j.contains("jobs") || !j["jobs"].is_object()) {
            error = "Invalid snapshot format";
            LOG_WARN("STATE: " + error);
            return false;
        }
        if (j.value("version", 0) != SNAPSHOT_VERSION) {
            error = "Unsupported snapshot version";
            LOG_WARN("STATE: " + error);
            return false;
        }

        const int64_t saved_at = j.value("saved_at", static_cast<int64_t>(0));
        if (ttl_hours > 0 && now_ms() - saved_at > static_cast<int64_t>(ttl_hours) * 3600 * 1000) {
            error = "Snapshot expired";
            LOG_INFO("STATE: Ignoring snapshot older than " + std::to_string(ttl_hours) + " h");
            return false;
        }

        transfer_id = j.value("transfer_id", "");
        for (const auto& item : j["jobs"].items()) {
            FileUploadJob job;
            if (!job_from_json(item.key(), item.value(), job)) {
                LOG_WARN("STATE: Skipping malformed job " + item.key());
                continue;
            }
            // The process that was uploading is gone
            if (job.status == JobStatus::UPLOADING || job.status == JobStatus::PENDING) {
                job.status = JobStatus::PAUSED;
            }
            job.progress = job.size > 0
                ? static_cast<double>(job.completed_bytes()) * 100.0 / static_cast<double>(job.size)
                : 0.0;
            if (job.status != JobStatus::COMPLETED && job.progress >= 100.0) {
                job.progress = 99.9;
            }
            loaded[job.id] = std::move(job);
        }

    } catch (const std::exception& e) {
        error = "Failed to parse snapshot: " + std::string(e.what());
        LOG_WARN("STATE: " + error);
        return false;
    }

    if (loaded.empty()) {
        error = "Snapshot holds no jobs";
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!transfer_id.empty()) {
        m_transfer_id = transfer_id;
    }
    m_jobs = std::move(loaded);
    LOG_INFO("STATE: Restored " + std::to_string(m_jobs.size()) + " jobs of transfer " + m_transfer_id);
    return true;
}
