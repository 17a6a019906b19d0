#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace wsbridge {

/// Receives archive bytes in order. Return false to abort the archive.
using ZipSink = std::function<bool(const char* data, size_t size)>;

/// Incremental PKZIP writer. Entries are written one at a time with data
/// descriptors, so nothing but the current deflate buffer and the central
/// directory is held in memory.
///
/// Usage: add_directory() / begin_file() + write()* + end_file(), then
/// finish(). Each call returns an error message, or empty on success. After
/// the first error every later call returns that same error.
///
/// Classic ZIP only: archives past 4 GiB offsets or 65535 entries fail.
class ZipWriter {
public:
    explicit ZipWriter(ZipSink sink);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    std::string add_directory(const std::string& name,
                              std::chrono::system_clock::time_point mtime);

    std::string begin_file(const std::string& name,
                           std::chrono::system_clock::time_point mtime);

    std::string write(const char* data, size_t size);

    std::string end_file();

    /// Writes the central directory and end record.
    std::string finish();

    uint64_t bytes_written() const { return offset_; }
    size_t entry_count() const { return entries_.size(); }
    const std::string& error() const { return error_; }

private:
    struct Entry {
        std::string name;
        uint16_t flags = 0;
        uint16_t method = 0;
        uint16_t dos_time = 0;
        uint16_t dos_date = 0;
        uint32_t crc = 0;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint64_t local_offset = 0;
        bool is_directory = false;
    };

    std::string begin_entry(Entry entry);
    std::string emit(const void* data, size_t size);
    std::string deflate_chunk(const char* data, size_t size, int flush);
    std::string fail(const std::string& message);

    ZipSink sink_;
    uint64_t offset_ = 0;
    std::vector<Entry> entries_;
    bool in_file_ = false;
    bool finished_ = false;
    std::string error_;

    struct DeflateState;
    std::unique_ptr<DeflateState> deflate_;
    std::vector<unsigned char> out_buffer_;
};

}  // namespace wsbridge
