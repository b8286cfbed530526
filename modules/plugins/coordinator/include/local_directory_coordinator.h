#ifndef LOCAL_DIRECTORY_COORDINATOR_H
#define LOCAL_DIRECTORY_COORDINATOR_H

#include "transfer_coordinator.h"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

/**
 * Coordinator backed by a local directory. Implements the multipart
 * contract without a network so the CLI and integration tests can run the
 * full pipeline.
 *
 * Layout under root:
 *   transfers/<transfer_id>.json      registered transfers (status, expires_at)
 *   uploads/<upload_id>/meta.json     open multipart sessions
 *   uploads/<upload_id>/part-<n>      accepted parts
 *   objects/<remote_key>              assembled objects
 *
 * Part etags are the CRC32 of the part, as 8 hex digits.
 */
class LocalDirectoryCoordinator : public TransferCoordinator {
public:
    struct Options {
        std::string root = "chunklift_store";
        int transfer_ttl_hours = 168;
        size_t write_step = 64 * 1024;      // bytes per progress/abort check
    };

    explicit LocalDirectoryCoordinator(const Options& options);

    // Create the directory layout
    bool open(std::string& error);

    bool register_transfer(const std::string& transfer_id);
    bool mark_transfer_completed(const std::string& transfer_id);

    std::string object_path(const std::string& remote_key) const;

    CoordinatorResult create_upload(const std::string& file_id,
                                    const std::string& filename,
                                    uint64_t size,
                                    RemoteUpload& out) override;

    CoordinatorResult upload_part(const std::string& remote_key,
                                  const std::string& upload_id,
                                  uint32_t part_number,
                                  const std::vector<uint8_t>& bytes,
                                  ProgressCB progress = {},
                                  AbortCB should_abort = {}) override;

    CoordinatorResult complete_upload(const std::string& remote_key,
                                      const std::string& upload_id,
                                      const std::vector<CompletedPart>& parts) override;

    CoordinatorResult put_whole(const std::string& remote_key,
                                const std::vector<uint8_t>& bytes,
                                ProgressCB progress = {},
                                AbortCB should_abort = {}) override;

    TransferValidation validate_still_open(const std::string& transfer_id) override;

    static uint32_t calculate_crc32(const std::vector<uint8_t>& data);
    static std::string etag_of(const std::vector<uint8_t>& data);

private:
    std::string upload_dir(const std::string& upload_id) const;
    std::string transfer_file(const std::string& transfer_id) const;
    bool write_transfer(const std::string& transfer_id, const std::string& status, int64_t expires_at);

    // Chunked write to tmp + rename, polling should_abort between steps
    CoordinatorResult write_file(const std::string& path, const std::vector<uint8_t>& bytes,
                                 const ProgressCB& progress, const AbortCB& should_abort);

    static bool is_safe_name(const std::string& name);

    Options m_options;
    std::mutex m_mutex;     // guards transfer records and object assembly
};

#endif // LOCAL_DIRECTORY_COORDINATOR_H
