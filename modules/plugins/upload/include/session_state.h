#ifndef SESSION_STATE_H
#define SESSION_STATE_H

#include "upload_types.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

/**
 * One file being uploaded. The local path is kept as a reselection hint
 * only; the snapshot never stores file contents.
 */
struct FileUploadJob {
    std::string id;
    std::string filename;
    std::string local_path;
    uint64_t size = 0;
    std::string remote_key;
    std::string upload_id;
    ChunkLayout layout;                         // unplanned for single uploads
    std::vector<CompletedPart> completed_parts; // sorted by part_number, no duplicates
    uint32_t current_part = 0;                  // last part that completed
    JobStatus status = JobStatus::PENDING;
    double progress = 0.0;                      // fractional, see progress_percent()
    std::string error_message;

    bool is_multipart() const { return layout.is_planned(); }
    uint32_t total_parts() const { return layout.total_parts(size); }
    bool has_part(uint32_t part_number) const;
    uint64_t completed_bytes() const;

    // Whole percent in 0..100, rounded down; 100 only once the job is completed
    int progress_percent() const;

    // Sorted insert. Returns false if the part was already recorded.
    bool insert_part(const CompletedPart& part);
};

/**
 * SESSION STATE
 *
 * Jobs of one upload session plus their pause/resume/cancel state machine:
 *
 *   pending   -> uploading | cancelled
 *   uploading -> completed | paused | error | cancelled
 *   paused    -> uploading | error | cancelled
 *   error     -> uploading | cancelled
 *
 * Every transition and every recorded part rewrites the JSON snapshot
 * (temp file + rename). Thread-safe.
 */
class SessionState {
public:
    using Listener = std::function<void(const FileUploadJob&)>;

    explicit SessionState(std::string snapshot_path, std::string transfer_id = "");

    const std::string& snapshot_path() const { return m_snapshot_path; }
    std::string transfer_id() const;
    void set_transfer_id(const std::string& transfer_id);

    // Status/progress change notifications (called without the state lock)
    void set_listener(Listener listener);

    bool add_job(const FileUploadJob& job);
    bool get_job(const std::string& id, FileUploadJob& out) const;
    bool has_job(const std::string& id) const;
    std::vector<FileUploadJob> jobs() const;

    static bool is_valid_transition(JobStatus from, JobStatus to);

    /**
     * Move a job to a new status. Illegal transitions are rejected and logged.
     * error_message is stored for ERROR and cleared otherwise.
     */
    bool transition(const std::string& id, JobStatus to, const std::string& error_message = "");

    bool record_part(const std::string& id, const CompletedPart& part);
    bool set_remote_upload(const std::string& id, const std::string& upload_id,
                           const std::string& remote_key);
    bool set_layout(const std::string& id, const ChunkLayout& layout);
    bool set_local_path(const std::string& id, const std::string& path);

    // Progress is monotonic per job and not persisted on every update
    void set_progress(const std::string& id, double percent);

    // Replace the message of a job already in error
    bool set_error_message(const std::string& id, const std::string& message);

    // Forget the multipart session (transfer found invalid): restart from zero
    bool reset_remote_state(const std::string& id);

    /**
     * Read the snapshot file. Jobs that were uploading are marked paused.
     * Snapshots older than ttl_hours are ignored (ttl_hours <= 0 disables).
     * @return false if there is nothing usable to restore
     */
    bool load(int ttl_hours, std::string& error);

    bool save();
    void clear_snapshot();

    // true when every job is completed or cancelled
    bool all_finished() const;

private:
    bool save_locked();
    // Save, or drop the snapshot once nothing is left to resume
    void persist_locked();
    bool all_finished_locked() const;
    void notify(const FileUploadJob& job);

    std::string m_snapshot_path;
    std::string m_transfer_id;

    mutable std::mutex m_mutex;
    Listener m_listener;
    std::map<std::string, FileUploadJob> m_jobs;
};

#endif // SESSION_STATE_H
