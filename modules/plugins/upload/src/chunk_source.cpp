#include "chunk_source.h"
#include "logger.h"

#include <filesystem>
#include <system_error>

ChunkSource::ChunkSource(std::string file_path, uint64_t file_size, const ChunkLayout& layout)
    : m_path(std::move(file_path)),
      m_file_size(file_size),
      m_layout(layout),
      m_total_parts(layout.total_parts(file_size)) {}

bool ChunkSource::open(UploadError& err) {
    std::error_code ec;
    const auto actual = std::filesystem::file_size(m_path, ec);
    if (ec) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.message = "Cannot stat source file " + m_path + ": " + ec.message();
        LOG_WARN("UP: " + err.message);
        return false;
    }
    if (static_cast<uint64_t>(actual) != m_file_size) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.message = "Source file " + m_path + " changed size (expected " +
                      std::to_string(m_file_size) + ", found " + std::to_string(actual) + ")";
        LOG_WARN("UP: " + err.message);
        return false;
    }

    m_stream.close();
    m_stream.clear();
    m_stream.open(m_path, std::ios::binary);
    if (!m_stream.is_open()) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.message = "Cannot open source file " + m_path;
        LOG_WARN("UP: " + err.message);
        return false;
    }
    return true;
}

ChunkDescriptor ChunkSource::describe(uint32_t part_number) const {
    ChunkDescriptor d;
    d.part_number = part_number;
    d.offset = m_layout.offset_of(part_number);
    d.length = m_layout.length_of(part_number, m_file_size);
    d.is_final = part_number == m_total_parts;
    return d;
}

bool ChunkSource::next_descriptor(ChunkDescriptor& out) {
    if (exhausted()) {
        return false;
    }
    out = describe(m_next_part);
    ++m_next_part;
    return true;
}

bool ChunkSource::read(const ChunkDescriptor& descriptor, Chunk& out, UploadError& err) {
    if (!m_stream.is_open()) {
        err.kind = UploadErrorKind::IO_ERROR;
        err.part_number = descriptor.part_number;
        err.message = "Source file is not open: " + m_path;
        return false;
    }

    out.descriptor = descriptor;
    out.data.resize(static_cast<size_t>(descriptor.length));

    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(descriptor.offset), std::ios::beg);
    if (descriptor.length == 0) {
        return true;
    }
    m_stream.read(reinterpret_cast<char*>(out.data.data()),
                  static_cast<std::streamsize>(descriptor.length));
    if (!m_stream || static_cast<uint64_t>(m_stream.gcount()) != descriptor.length) {
        out.data.clear();
        err.kind = UploadErrorKind::IO_ERROR;
        err.part_number = descriptor.part_number;
        err.message = "Failed to read part " + std::to_string(descriptor.part_number) +
                      " from " + m_path;
        LOG_WARN("UP: " + err.message);
        return false;
    }
    return true;
}

bool ChunkSource::next(Chunk& out, UploadError& err) {
    ChunkDescriptor descriptor;
    if (!next_descriptor(descriptor)) {
        return false;
    }
    return read(descriptor, out, err);
}

void ChunkSource::seek(uint32_t part_number) {
    m_next_part = part_number == 0 ? 1 : part_number;
}
