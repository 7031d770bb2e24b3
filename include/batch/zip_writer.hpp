#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief Minimal streaming ZIP archive writer (deflate via zlib)
 *
 * Entries are written as they are added; finish() appends the central
 * directory. Timestamps are fixed (1980-01-01) so identical input yields a
 * byte-identical archive. No ZIP64: more than 65535 entries or offsets past
 * 4 GiB throw std::runtime_error.
 */
class ZipWriter {
public:
    explicit ZipWriter(std::ostream& out);

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @throws std::runtime_error on duplicate name, zlib or stream failure
     */
    void add_file(const std::string& name, std::string_view content);

    /**
     * @brief Write the central directory; no entries may be added afterwards
     */
    void finish();

    [[nodiscard]] size_t entry_count() const { return entries_.size(); }
    [[nodiscard]] bool finished() const { return finished_; }

    [[nodiscard]] static std::string deflate_raw(std::string_view data);

private:
    struct Entry {
        std::string name;
        uint16_t method;
        uint32_t crc;
        uint32_t compressed_size;
        uint32_t size;
        uint32_t offset;
    };

    void write_u16(uint16_t v);
    void write_u32(uint32_t v);
    void write_bytes(std::string_view bytes);

    std::ostream& out_;
    uint64_t offset_ = 0;
    std::vector<Entry> entries_;
    bool finished_ = false;
};

} // namespace sentinel
