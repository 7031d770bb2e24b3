#include "batch/document_decoder.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>

namespace sentinel {

namespace {

constexpr std::string_view kBomUtf8 = "\xEF\xBB\xBF";
constexpr std::string_view kBomUtf32Le = std::string_view("\xFF\xFE\x00\x00", 4);
constexpr std::string_view kBomUtf32Be = std::string_view("\x00\x00\xFE\xFF", 4);
constexpr std::string_view kBomUtf16Le = "\xFF\xFE";
constexpr std::string_view kBomUtf16Be = "\xFE\xFF";

bool starts_with(std::string_view data, std::string_view prefix) {
    return data.size() >= prefix.size() && data.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

DocumentDecoder::DocumentDecoder(Config config)
    : config_(std::move(config)) {}

bool DocumentDecoder::extension_allowed(std::string_view name) const {
    if (config_.allowed_extensions.empty()) return true;
    for (const auto& ext : config_.allowed_extensions) {
        if (utils::ends_with_ci(name, ext)) return true;
    }
    return false;
}

size_t DocumentDecoder::find_invalid_utf8(std::string_view text) {
    const auto* s = reinterpret_cast<const uint8_t*>(text.data());
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        const uint8_t c = s[i];
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((c & 0xE0) == 0xC0) {
            len = 2; cp = c & 0x1F; min_cp = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            len = 3; cp = c & 0x0F; min_cp = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            len = 4; cp = c & 0x07; min_cp = 0x10000;
        } else {
            return i;
        }

        if (i + len > n) return i;
        for (size_t k = 1; k < len; ++k) {
            const uint8_t cc = s[i + k];
            if ((cc & 0xC0) != 0x80) return i;
            cp = (cp << 6) | (cc & 0x3F);
        }

        // Overlong, surrogate, or beyond U+10FFFF
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return i;
        }
        i += len;
    }
    return std::string_view::npos;
}

Result<std::string> DocumentDecoder::decode(std::string_view name, std::string bytes) const {
    if (!extension_allowed(name)) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("unsupported format: '{}' is not a text document", name));
    }
    if (bytes.size() > config_.max_document_bytes) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("document is {} bytes, limit is {}", bytes.size(), config_.max_document_bytes));
    }

    const std::string_view view(bytes);
    if (starts_with(view, kBomUtf32Le) || starts_with(view, kBomUtf32Be)) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            "unsupported encoding: UTF-32");
    }
    if (starts_with(view, kBomUtf16Le) || starts_with(view, kBomUtf16Be)) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            "unsupported encoding: UTF-16");
    }
    if (starts_with(view, kBomUtf8)) {
        bytes.erase(0, kBomUtf8.size());
    }

    const auto nul = bytes.find('\0');
    if (nul != std::string::npos) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("binary content: NUL byte at offset {}", nul));
    }

    const auto bad = find_invalid_utf8(bytes);
    if (bad != std::string_view::npos) {
        return Result<std::string>::error(ErrorCategory::UNSUPPORTED_DOCUMENT,
            std::format("invalid UTF-8 sequence at offset {}", bad));
    }

    return Result<std::string>::ok(std::move(bytes));
}

} // namespace sentinel
