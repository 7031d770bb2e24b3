#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief Turns a named byte source into scannable UTF-8 text
 *
 * Checks, in order:
 * - extension allow-list (case-insensitive; empty list accepts any name)
 * - size limit
 * - UTF-16 / UTF-32 byte order marks (unsupported encoding)
 * - UTF-8 BOM (stripped)
 * - NUL bytes (binary content)
 * - strict UTF-8 well-formedness
 *
 * Every failure is UNSUPPORTED_DOCUMENT.
 */
class DocumentDecoder {
public:
    struct Config {
        std::vector<std::string> allowed_extensions = {
            ".txt", ".md", ".json", ".csv", ".tsv", ".log", ".xml", ".yaml", ".yml"};
        size_t max_document_bytes = 10 * 1024 * 1024;
    };

    DocumentDecoder() : DocumentDecoder(Config{}) {}
    explicit DocumentDecoder(Config config);

    [[nodiscard]] Result<std::string> decode(std::string_view name, std::string bytes) const;

    [[nodiscard]] bool extension_allowed(std::string_view name) const;

    /**
     * @brief Offset of the first malformed UTF-8 sequence, or npos if valid
     */
    [[nodiscard]] static size_t find_invalid_utf8(std::string_view text);

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace sentinel
