#include "batch/zip_writer.hpp"

#include <zlib.h>

#include <format>
#include <limits>
#include <stdexcept>

namespace sentinel {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;

constexpr uint16_t kVersion = 20;           // 2.0: deflate
constexpr uint16_t kFlagUtf8Names = 0x0800;
constexpr uint16_t kMethodStore = 0;
constexpr uint16_t kMethodDeflate = 8;
constexpr uint16_t kDosTime = 0;            // 00:00:00
constexpr uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;  // 1980-01-01

constexpr uint64_t kMax32 = std::numeric_limits<uint32_t>::max();

} // anonymous namespace

ZipWriter::ZipWriter(std::ostream& out)
    : out_(out) {}

void ZipWriter::write_u16(uint16_t v) {
    const char bytes[2] = {
        static_cast<char>(v & 0xFF),
        static_cast<char>((v >> 8) & 0xFF)};
    write_bytes(std::string_view(bytes, 2));
}

void ZipWriter::write_u32(uint32_t v) {
    const char bytes[4] = {
        static_cast<char>(v & 0xFF),
        static_cast<char>((v >> 8) & 0xFF),
        static_cast<char>((v >> 16) & 0xFF),
        static_cast<char>((v >> 24) & 0xFF)};
    write_bytes(std::string_view(bytes, 4));
}

void ZipWriter::write_bytes(std::string_view bytes) {
    out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out_) {
        throw std::runtime_error("ZIP output stream write failed");
    }
    offset_ += bytes.size();
}

std::string ZipWriter::deflate_raw(std::string_view data) {
    z_stream zs{};
    // Negative windowBits: raw deflate stream, no zlib/gzip wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                     -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string compressed;
    compressed.resize(deflateBound(&zs, static_cast<uLong>(data.size())));

    zs.next_out = reinterpret_cast<Bytef*>(compressed.data());
    zs.avail_out = static_cast<uInt>(compressed.size());

    const int ret = deflate(&zs, Z_FINISH);
    deflateEnd(&zs);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::format("deflate failed ({})", ret));
    }

    compressed.resize(zs.total_out);
    return compressed;
}

void ZipWriter::add_file(const std::string& name, std::string_view content) {
    if (finished_) {
        throw std::runtime_error("ZIP archive already finished");
    }
    if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("ZIP entry name must be 1-65535 bytes");
    }
    for (const auto& e : entries_) {
        if (e.name == name) {
            throw std::runtime_error(std::format("duplicate ZIP entry '{}'", name));
        }
    }
    if (entries_.size() >= std::numeric_limits<uint16_t>::max()) {
        throw std::runtime_error("ZIP archive entry limit reached");
    }
    if (content.size() > kMax32 || offset_ > kMax32) {
        throw std::runtime_error("ZIP archive exceeds 4 GiB (ZIP64 not supported)");
    }

    Entry entry;
    entry.name = name;
    entry.size = static_cast<uint32_t>(content.size());
    entry.crc = static_cast<uint32_t>(crc32(
        crc32(0L, Z_NULL, 0),
        reinterpret_cast<const Bytef*>(content.data()),
        static_cast<uInt>(content.size())));
    entry.offset = static_cast<uint32_t>(offset_);

    std::string compressed = deflate_raw(content);
    std::string_view payload = compressed;
    entry.method = kMethodDeflate;
    if (compressed.size() >= content.size()) {
        // Incompressible (or empty): store as-is
        payload = content;
        entry.method = kMethodStore;
    }
    entry.compressed_size = static_cast<uint32_t>(payload.size());

    write_u32(kLocalHeaderSig);
    write_u16(kVersion);
    write_u16(kFlagUtf8Names);
    write_u16(entry.method);
    write_u16(kDosTime);
    write_u16(kDosDate);
    write_u32(entry.crc);
    write_u32(entry.compressed_size);
    write_u32(entry.size);
    write_u16(static_cast<uint16_t>(entry.name.size()));
    write_u16(0);  // extra field length
    write_bytes(entry.name);
    write_bytes(payload);

    entries_.push_back(std::move(entry));
}

void ZipWriter::finish() {
    if (finished_) return;
    if (offset_ > kMax32) {
        throw std::runtime_error("ZIP archive exceeds 4 GiB (ZIP64 not supported)");
    }

    const auto cd_offset = static_cast<uint32_t>(offset_);
    for (const auto& e : entries_) {
        write_u32(kCentralHeaderSig);
        write_u16(kVersion);        // version made by
        write_u16(kVersion);        // version needed
        write_u16(kFlagUtf8Names);
        write_u16(e.method);
        write_u16(kDosTime);
        write_u16(kDosDate);
        write_u32(e.crc);
        write_u32(e.compressed_size);
        write_u32(e.size);
        write_u16(static_cast<uint16_t>(e.name.size()));
        write_u16(0);               // extra
        write_u16(0);               // comment
        write_u16(0);               // disk number
        write_u16(0);               // internal attributes
        write_u32(0);               // external attributes
        write_u32(e.offset);
        write_bytes(e.name);
    }
    const auto cd_size = static_cast<uint32_t>(offset_ - cd_offset);
    const auto count = static_cast<uint16_t>(entries_.size());

    write_u32(kEndOfCentralDirSig);
    write_u16(0);                   // this disk
    write_u16(0);                   // disk with central directory
    write_u16(count);
    write_u16(count);
    write_u32(cd_size);
    write_u32(cd_offset);
    write_u16(0);                   // comment length

    out_.flush();
    finished_ = true;
}

} // namespace sentinel
