#include "detection/redactor.hpp"

#include <format>
#include <stdexcept>

namespace sentinel {

std::string Redactor::token_for(std::string_view type) {
    std::string token;
    token.reserve(type.size() + 2);
    token += '[';
    token.append(type);
    token += ']';
    return token;
}

std::string Redactor::redact(
    std::string_view document,
    const std::vector<ResolvedMatch>& resolved) {

    if (resolved.empty()) {
        return std::string(document);
    }

    std::string result;
    result.reserve(document.size());

    size_t cursor = 0;
    for (const auto& match : resolved) {
        if (match.start < cursor) {
            throw std::invalid_argument(std::format(
                "resolved match {} [{}, {}) overlaps or precedes offset {}",
                match.type, match.start, match.end, cursor));
        }
        if (match.end <= match.start || match.end > document.size()) {
            throw std::invalid_argument(std::format(
                "resolved match {} [{}, {}) is empty or outside document of {} bytes",
                match.type, match.start, match.end, document.size()));
        }

        result.append(document.substr(cursor, match.start - cursor));
        result += token_for(match.type);
        cursor = match.end;
    }

    result.append(document.substr(cursor));
    return result;
}

} // namespace sentinel
