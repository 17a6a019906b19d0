#include "wsbridge/zip_writer.hpp"
#include "wsbridge/core/constants.hpp"

#include <zlib.h>

#include <algorithm>
#include <ctime>
#include <limits>

namespace wsbridge {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t DATA_DESCRIPTOR_SIG = 0x08074b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_RECORD_SIG = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;
constexpr uint16_t VERSION_MADE_BY = (3 << 8) | 20;   // unix, 2.0

constexpr uint16_t FLAG_DATA_DESCRIPTOR = 0x0008;
constexpr uint16_t FLAG_UTF8 = 0x0800;

constexpr uint16_t METHOD_STORED = 0;
constexpr uint16_t METHOD_DEFLATED = 8;

constexpr uint64_t MAX_CLASSIC_SIZE = std::numeric_limits<uint32_t>::max();
constexpr size_t MAX_CLASSIC_ENTRIES = std::numeric_limits<uint16_t>::max();

void put16(std::string& out, uint16_t v) {
    out += static_cast<char>(v & 0xff);
    out += static_cast<char>((v >> 8) & 0xff);
}

void put32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out += static_cast<char>((v >> (8 * i)) & 0xff);
}

void to_dos_time(std::chrono::system_clock::time_point tp, uint16_t& dos_time, uint16_t& dos_date) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    if (tm.tm_year < 80) {
        dos_time = 0;
        dos_date = (1 << 5) | 1;   // 1980-01-01
        return;
    }
    dos_time = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
    dos_date = static_cast<uint16_t>(((tm.tm_year - 80) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

}  // namespace

struct ZipWriter::DeflateState {
    z_stream stream{};
    bool initialized = false;

    ~DeflateState() {
        if (initialized) deflateEnd(&stream);
    }
};

ZipWriter::ZipWriter(ZipSink sink)
    : sink_(std::move(sink))
    , deflate_(std::make_unique<DeflateState>())
    , out_buffer_(constants::ZIP_DEFLATE_BUFFER_SIZE) {}

ZipWriter::~ZipWriter() = default;

std::string ZipWriter::fail(const std::string& message) {
    if (error_.empty()) error_ = message;
    return error_;
}

std::string ZipWriter::emit(const void* data, size_t size) {
    if (size == 0) return {};
    if (!sink_(static_cast<const char*>(data), size)) {
        return fail("Archive output aborted");
    }
    offset_ += size;
    return {};
}

// --- Entries ---

std::string ZipWriter::begin_entry(Entry entry) {
    if (!error_.empty()) return error_;
    if (finished_) return fail("Archive already finished");
    if (in_file_) return fail("Previous file entry not ended");
    if (entry.name.empty() || entry.name.size() > std::numeric_limits<uint16_t>::max()) {
        return fail("Invalid entry name");
    }
    if (entries_.size() >= MAX_CLASSIC_ENTRIES) {
        return fail("Archive exceeds 65535 entries");
    }
    if (offset_ > MAX_CLASSIC_SIZE) {
        return fail("Archive exceeds 4 GiB");
    }

    entry.local_offset = offset_;

    std::string header;
    header.reserve(30 + entry.name.size());
    put32(header, LOCAL_HEADER_SIG);
    put16(header, VERSION_NEEDED);
    put16(header, entry.flags);
    put16(header, entry.method);
    put16(header, entry.dos_time);
    put16(header, entry.dos_date);
    put32(header, 0);   // crc, sizes follow in the data descriptor
    put32(header, 0);
    put32(header, 0);
    put16(header, static_cast<uint16_t>(entry.name.size()));
    put16(header, 0);
    header += entry.name;

    entries_.push_back(std::move(entry));
    return emit(header.data(), header.size());
}

std::string ZipWriter::add_directory(const std::string& name,
                                     std::chrono::system_clock::time_point mtime) {
    Entry entry;
    entry.name = name.ends_with('/') ? name : name + "/";
    entry.flags = FLAG_UTF8;
    entry.method = METHOD_STORED;
    entry.is_directory = true;
    to_dos_time(mtime, entry.dos_time, entry.dos_date);
    return begin_entry(std::move(entry));
}

std::string ZipWriter::begin_file(const std::string& name,
                                  std::chrono::system_clock::time_point mtime) {
    Entry entry;
    entry.name = name;
    entry.flags = FLAG_UTF8 | FLAG_DATA_DESCRIPTOR;
    entry.method = METHOD_DEFLATED;
    entry.crc = static_cast<uint32_t>(crc32(0L, Z_NULL, 0));
    to_dos_time(mtime, entry.dos_time, entry.dos_date);

    auto err = begin_entry(std::move(entry));
    if (!err.empty()) return err;

    deflate_->stream = z_stream{};
    int rc = deflateInit2(&deflate_->stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                          -MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) return fail("deflateInit2 failed: " + std::to_string(rc));
    deflate_->initialized = true;
    in_file_ = true;
    return {};
}

std::string ZipWriter::deflate_chunk(const char* data, size_t size, int flush) {
    auto& zs = deflate_->stream;
    auto& entry = entries_.back();

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    zs.avail_in = static_cast<uInt>(size);

    while (true) {
        zs.next_out = out_buffer_.data();
        zs.avail_out = static_cast<uInt>(out_buffer_.size());

        int rc = deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) return fail("deflate failed");

        size_t produced = out_buffer_.size() - zs.avail_out;
        entry.compressed_size += produced;
        auto err = emit(out_buffer_.data(), produced);
        if (!err.empty()) return err;

        if (flush == Z_FINISH) {
            if (rc == Z_STREAM_END) return {};
        } else if (zs.avail_in == 0 && zs.avail_out != 0) {
            return {};
        }
    }
}

std::string ZipWriter::write(const char* data, size_t size) {
    if (!error_.empty()) return error_;
    if (!in_file_) return fail("No file entry open");

    auto& entry = entries_.back();
    entry.uncompressed_size += size;
    if (entry.uncompressed_size > MAX_CLASSIC_SIZE) {
        return fail("Entry '" + entry.name + "' exceeds 4 GiB");
    }

    // crc32 takes uInt lengths; feed in bounded pieces
    const char* p = data;
    size_t remaining = size;
    while (remaining > 0) {
        auto piece = static_cast<uInt>(std::min<size_t>(remaining, 1u << 30));
        entry.crc = static_cast<uint32_t>(crc32(entry.crc, reinterpret_cast<const Bytef*>(p), piece));
        auto err = deflate_chunk(p, piece, Z_NO_FLUSH);
        if (!err.empty()) return err;
        p += piece;
        remaining -= piece;
    }
    return {};
}

std::string ZipWriter::end_file() {
    if (!error_.empty()) return error_;
    if (!in_file_) return fail("No file entry open");

    auto err = deflate_chunk(nullptr, 0, Z_FINISH);
    if (!err.empty()) return err;
    deflateEnd(&deflate_->stream);
    deflate_->initialized = false;
    in_file_ = false;

    const auto& entry = entries_.back();
    if (entry.compressed_size > MAX_CLASSIC_SIZE) {
        return fail("Entry '" + entry.name + "' exceeds 4 GiB compressed");
    }

    std::string descriptor;
    put32(descriptor, DATA_DESCRIPTOR_SIG);
    put32(descriptor, entry.crc);
    put32(descriptor, static_cast<uint32_t>(entry.compressed_size));
    put32(descriptor, static_cast<uint32_t>(entry.uncompressed_size));
    return emit(descriptor.data(), descriptor.size());
}

// --- Central directory ---

std::string ZipWriter::finish() {
    if (!error_.empty()) return error_;
    if (finished_) return {};
    if (in_file_) return fail("File entry not ended");

    uint64_t cd_offset = offset_;
    if (cd_offset > MAX_CLASSIC_SIZE) return fail("Archive exceeds 4 GiB");

    for (const auto& entry : entries_) {
        std::string header;
        header.reserve(46 + entry.name.size());
        put32(header, CENTRAL_HEADER_SIG);
        put16(header, VERSION_MADE_BY);
        put16(header, VERSION_NEEDED);
        put16(header, entry.flags);
        put16(header, entry.method);
        put16(header, entry.dos_time);
        put16(header, entry.dos_date);
        put32(header, entry.crc);
        put32(header, static_cast<uint32_t>(entry.compressed_size));
        put32(header, static_cast<uint32_t>(entry.uncompressed_size));
        put16(header, static_cast<uint16_t>(entry.name.size()));
        put16(header, 0);   // extra
        put16(header, 0);   // comment
        put16(header, 0);   // disk
        put16(header, 0);   // internal attributes
        uint32_t mode = entry.is_directory ? ((040755u << 16) | 0x10) : (0100644u << 16);
        put32(header, mode);
        put32(header, static_cast<uint32_t>(entry.local_offset));
        header += entry.name;

        auto err = emit(header.data(), header.size());
        if (!err.empty()) return err;
    }

    uint64_t cd_size = offset_ - cd_offset;
    if (offset_ > MAX_CLASSIC_SIZE) return fail("Archive exceeds 4 GiB");

    std::string end;
    put32(end, END_RECORD_SIG);
    put16(end, 0);
    put16(end, 0);
    put16(end, static_cast<uint16_t>(entries_.size()));
    put16(end, static_cast<uint16_t>(entries_.size()));
    put32(end, static_cast<uint32_t>(cd_size));
    put32(end, static_cast<uint32_t>(cd_offset));
    put16(end, 0);

    auto err = emit(end.data(), end.size());
    if (!err.empty()) return err;
    finished_ = true;
    return {};
}

}  // namespace wsbridge
