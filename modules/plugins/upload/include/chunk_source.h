#ifndef CHUNK_SOURCE_H
#define CHUNK_SOURCE_H

#include "upload_types.h"
#include <fstream>
#include <string>

/**
 * Lazily carves a file into ordered chunks following a fixed ChunkLayout.
 *
 * Descriptors can be walked without touching the disk, so parts that were
 * already uploaded are skipped without I/O. Payloads are read one at a
 * time, just before dispatch.
 */
class ChunkSource {
public:
    ChunkSource(std::string file_path, uint64_t file_size, const ChunkLayout& layout);

    /**
     * Open the file and verify it still holds file_size bytes.
     * @return false with an IO_ERROR in err otherwise
     */
    bool open(UploadError& err);
    bool is_open() const { return m_stream.is_open(); }

    /**
     * Advance to the next part without reading it.
     * @return false once every part has been produced
     */
    bool next_descriptor(ChunkDescriptor& out);

    /**
     * Materialize the payload of a descriptor.
     * @return false with an IO_ERROR in err on a failed read
     */
    bool read(const ChunkDescriptor& descriptor, Chunk& out, UploadError& err);

    /**
     * next_descriptor() + read(). Returns false at the end (err stays ok)
     * or on a read failure (err set).
     */
    bool next(Chunk& out, UploadError& err);

    // Position so that the next produced part is part_number (1-based)
    void seek(uint32_t part_number);
    void reset() { seek(1); }

    ChunkDescriptor describe(uint32_t part_number) const;
    uint32_t total_parts() const { return m_total_parts; }
    bool exhausted() const { return m_next_part > m_total_parts; }
    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    uint64_t m_file_size;
    ChunkLayout m_layout;
    uint32_t m_total_parts;
    uint32_t m_next_part = 1;
    std::ifstream m_stream;
};

#endif // CHUNK_SOURCE_H
