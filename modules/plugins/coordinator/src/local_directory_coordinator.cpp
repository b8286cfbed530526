#include "local_directory_coordinator.h"
#include "logger.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// CRC32 CALCULATION
// ============================================================================

namespace {

// Precomputed CRC32 lookup table
uint32_t crc32_table[256];
std::once_flag crc32_once;

void init_crc32_table() {
    for (uint32_t i = 0; i < 256; i++) {
        uint32_t crc = i;
        for (int j = 0; j < 8; j++) {
            if (crc & 1) {
                crc = (crc >> 1) ^ 0xEDB88320UL;
            } else {
                crc >>= 1;
            }
        }
        crc32_table[i] = crc;
    }
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

CoordinatorResult failure(CoordinatorOutcome outcome, int status, const std::string& message) {
    CoordinatorResult r;
    r.outcome = outcome;
    r.status = status;
    r.message = message;
    return r;
}

} // namespace

uint32_t LocalDirectoryCoordinator::calculate_crc32(const std::vector<uint8_t>& data) {
    std::call_once(crc32_once, init_crc32_table);
    uint32_t crc = 0xFFFFFFFFUL;
    for (uint8_t byte : data) {
        crc = (crc >> 8) ^ crc32_table[(crc ^ byte) & 0xFF];
    }
    return crc ^ 0xFFFFFFFFUL;
}

std::string LocalDirectoryCoordinator::etag_of(const std::vector<uint8_t>& data) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << calculate_crc32(data);
    return oss.str();
}

// ============================================================================
// SETUP
// ============================================================================

LocalDirectoryCoordinator::LocalDirectoryCoordinator(const Options& options)
    : m_options(options) {
    if (m_options.write_step == 0) {
        m_options.write_step = 64 * 1024;
    }
}

bool LocalDirectoryCoordinator::open(std::string& error) {
    std::error_code ec;
    for (const char* sub : {"transfers", "uploads", "objects"}) {
        fs::create_directories(fs::path(m_options.root) / sub, ec);
        if (ec) {
            error = "Cannot create " + (fs::path(m_options.root) / sub).string() + ": " + ec.message();
            LOG_ERROR("COORD: " + error);
            return false;
        }
    }
    LOG_INFO("COORD: Local store at " + m_options.root);
    return true;
}

std::string LocalDirectoryCoordinator::upload_dir(const std::string& upload_id) const {
    return (fs::path(m_options.root) / "uploads" / upload_id).string();
}

std::string LocalDirectoryCoordinator::transfer_file(const std::string& transfer_id) const {
    return (fs::path(m_options.root) / "transfers" / (transfer_id + ".json")).string();
}

std::string LocalDirectoryCoordinator::object_path(const std::string& remote_key) const {
    return (fs::path(m_options.root) / "objects" / remote_key).string();
}

bool LocalDirectoryCoordinator::is_safe_name(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos) {
        return false;
    }
    for (const auto& component : fs::path(name)) {
        if (component == "..") return false;
    }
    return true;
}

// ============================================================================
// TRANSFERS
// ============================================================================

bool LocalDirectoryCoordinator::write_transfer(const std::string& transfer_id, const std::string& status,
                                               int64_t expires_at) {
    const std::string path = transfer_file(transfer_id);
    const std::string tmp_path = path + ".tmp";
    try {
        json j;
        j["transfer_id"] = transfer_id;
        j["status"] = status;
        j["expires_at"] = expires_at;

        std::ofstream ofs(tmp_path);
        if (!ofs.is_open()) {
            LOG_ERROR("COORD: Cannot write " + tmp_path);
            return false;
        }
        ofs << j.dump(2);
        ofs.close();
        if (ofs.fail() || std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            LOG_ERROR("COORD: Failed to store transfer " + transfer_id);
            std::remove(tmp_path.c_str());
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("COORD: Exception writing transfer: " + std::string(e.what()));
        std::remove(tmp_path.c_str());
        return false;
    }
}

bool LocalDirectoryCoordinator::register_transfer(const std::string& transfer_id) {
    if (!is_safe_name(transfer_id) || transfer_id.find('/') != std::string::npos) {
        LOG_WARN("COORD: Invalid transfer id '" + transfer_id + "'");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (fs::exists(transfer_file(transfer_id))) {
        return true;
    }
    const int64_t expires_at = now_ms() + static_cast<int64_t>(m_options.transfer_ttl_hours) * 3600 * 1000;
    LOG_DEBUG("COORD: Registered transfer " + transfer_id);
    return write_transfer(transfer_id, "open", expires_at);
}

bool LocalDirectoryCoordinator::mark_transfer_completed(const std::string& transfer_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    int64_t expires_at = 0;
    std::ifstream ifs(transfer_file(transfer_id));
    if (!ifs.is_open()) {
        return false;
    }
    try {
        json j;
        ifs >> j;
        expires_at = j.value("expires_at", static_cast<int64_t>(0));
    } catch (const std::exception& e) {
        LOG_WARN("COORD: Corrupt transfer record " + transfer_id + ": " + e.what());
        return false;
    }
    ifs.close();
    return write_transfer(transfer_id, "completed", expires_at);
}

TransferValidation LocalDirectoryCoordinator::validate_still_open(const std::string& transfer_id) {
    TransferValidation v;
    v.reason = "Transfer not found or expired";

    std::lock_guard<std::mutex> lock(m_mutex);
    std::ifstream ifs(transfer_file(transfer_id));
    if (!ifs.is_open()) {
        return v;
    }
    try {
        json j;
        ifs >> j;
        if (j.value("status", "") == "completed") {
            v.reason = "Transfer already completed";
            return v;
        }
        if (j.value("expires_at", static_cast<int64_t>(0)) < now_ms()) {
            return v;
        }
    } catch (const std::exception& e) {
        LOG_WARN("COORD: Corrupt transfer record " + transfer_id + ": " + e.what());
        return v;
    }

    v.valid = true;
    v.reason.clear();
    return v;
}

// ============================================================================
// UPLOADS
// ============================================================================

CoordinatorResult LocalDirectoryCoordinator::write_file(const std::string& path,
                                                        const std::vector<uint8_t>& bytes,
                                                        const ProgressCB& progress,
                                                        const AbortCB& should_abort) {
    const std::string tmp_path = path + ".tmp";
    std::ofstream ofs(tmp_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot write " + tmp_path);
    }

    size_t written = 0;
    while (written < bytes.size()) {
        if (should_abort && should_abort()) {
            ofs.close();
            std::remove(tmp_path.c_str());
            return failure(CoordinatorOutcome::ABORTED, 0, "Aborted");
        }
        const size_t step = std::min(m_options.write_step, bytes.size() - written);
        ofs.write(reinterpret_cast<const char*>(bytes.data() + written), static_cast<std::streamsize>(step));
        if (!ofs) {
            ofs.close();
            std::remove(tmp_path.c_str());
            return failure(CoordinatorOutcome::SERVER_ERROR, 507, "Write failed for " + path);
        }
        written += step;
        if (progress) {
            progress(written, bytes.size());
        }
    }

    ofs.close();
    if (ofs.fail() || std::rename(tmp_path.c_str(), path.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot store " + path);
    }
    return CoordinatorResult{};
}

CoordinatorResult LocalDirectoryCoordinator::create_upload(const std::string& file_id,
                                                           const std::string& filename,
                                                           uint64_t size,
                                                           RemoteUpload& out) {
    const std::string remote_key = file_id + "/" + filename;
    if (!is_safe_name(file_id) || !is_safe_name(filename) || !is_safe_name(remote_key)) {
        return failure(CoordinatorOutcome::REJECTED, 400, "Invalid file name");
    }

    std::random_device rd;
    std::ostringstream oss;
    oss << file_id << "-" << std::hex << std::setfill('0') << std::setw(8) << rd();
    const std::string upload_id = oss.str();

    std::error_code ec;
    fs::create_directories(upload_dir(upload_id), ec);
    if (ec) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot create upload: " + ec.message());
    }

    try {
        json meta;
        meta["remote_key"] = remote_key;
        meta["filename"] = filename;
        meta["size"] = size;
        std::ofstream ofs((fs::path(upload_dir(upload_id)) / "meta.json").string());
        ofs << meta.dump(2);
        if (!ofs) {
            return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot write upload metadata");
        }
    } catch (const std::exception& e) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, e.what());
    }

    out.upload_id = upload_id;
    out.remote_key = remote_key;
    LOG_DEBUG("COORD: Created upload " + upload_id + " for " + remote_key);
    return CoordinatorResult{};
}

CoordinatorResult LocalDirectoryCoordinator::upload_part(const std::string& remote_key,
                                                         const std::string& upload_id,
                                                         uint32_t part_number,
                                                         const std::vector<uint8_t>& bytes,
                                                         ProgressCB progress,
                                                         AbortCB should_abort) {
    if (part_number == 0 || part_number > 10000) {
        return failure(CoordinatorOutcome::REJECTED, 400, "Invalid part number");
    }
    if (!is_safe_name(upload_id) || !fs::is_directory(upload_dir(upload_id))) {
        return failure(CoordinatorOutcome::REJECTED, 404, "No such upload: " + upload_id);
    }

    const std::string path = (fs::path(upload_dir(upload_id)) / ("part-" + std::to_string(part_number))).string();
    CoordinatorResult r = write_file(path, bytes, progress, should_abort);
    if (!r.ok()) {
        return r;
    }
    r.etag = etag_of(bytes);
    LOG_DEBUG("COORD: " + remote_key + " part " + std::to_string(part_number) + " stored, etag " + r.etag);
    return r;
}

CoordinatorResult LocalDirectoryCoordinator::complete_upload(const std::string& remote_key,
                                                             const std::string& upload_id,
                                                             const std::vector<CompletedPart>& parts) {
    if (!is_safe_name(remote_key) || !is_safe_name(upload_id)) {
        return failure(CoordinatorOutcome::REJECTED, 400, "Invalid key");
    }
    if (!fs::is_directory(upload_dir(upload_id))) {
        return failure(CoordinatorOutcome::REJECTED, 404, "No such upload: " + upload_id);
    }
    if (parts.empty()) {
        return failure(CoordinatorOutcome::REJECTED, 400, "No parts");
    }
    for (size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].part_number <= parts[i - 1].part_number) {
            return failure(CoordinatorOutcome::REJECTED, 400, "Parts are not in ascending order");
        }
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    const fs::path target(object_path(remote_key));
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot create " + target.parent_path().string());
    }

    const std::string tmp_path = target.string() + ".tmp";
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot write " + tmp_path);
    }

    for (const auto& part : parts) {
        const std::string part_path =
            (fs::path(upload_dir(upload_id)) / ("part-" + std::to_string(part.part_number))).string();
        std::ifstream in(part_path, std::ios::binary);
        if (!in.is_open()) {
            out.close();
            std::remove(tmp_path.c_str());
            return failure(CoordinatorOutcome::REJECTED, 400,
                           "Part " + std::to_string(part.part_number) + " was never uploaded");
        }
        std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (etag_of(data) != part.etag) {
            out.close();
            std::remove(tmp_path.c_str());
            return failure(CoordinatorOutcome::REJECTED, 400,
                           "Etag mismatch for part " + std::to_string(part.part_number));
        }
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    out.close();

    if (out.fail() || std::rename(tmp_path.c_str(), target.string().c_str()) != 0) {
        std::remove(tmp_path.c_str());
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot assemble " + remote_key);
    }

    fs::remove_all(upload_dir(upload_id), ec);
    LOG_INFO("COORD: Assembled " + remote_key + " from " + std::to_string(parts.size()) + " parts");
    return CoordinatorResult{};
}

CoordinatorResult LocalDirectoryCoordinator::put_whole(const std::string& remote_key,
                                                       const std::vector<uint8_t>& bytes,
                                                       ProgressCB progress,
                                                       AbortCB should_abort) {
    if (!is_safe_name(remote_key)) {
        return failure(CoordinatorOutcome::REJECTED, 400, "Invalid key");
    }
    const fs::path target(object_path(remote_key));
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return failure(CoordinatorOutcome::SERVER_ERROR, 500, "Cannot create " + target.parent_path().string());
    }

    CoordinatorResult r = write_file(target.string(), bytes, progress, should_abort);
    if (r.ok()) {
        LOG_INFO("COORD: Stored " + remote_key + " (" + format_bytes(bytes.size()) + ")");
    }
    return r;
}
