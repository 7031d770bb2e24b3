#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief Rewrites a document by replacing every resolved span with a token
 *
 * Token format is "[TYPE]". Text outside resolved spans is copied
 * byte-for-byte. PatternRegistry guarantees no active pattern matches a token
 * of its own set, so redacting already-redacted output finds nothing new.
 */
class Redactor {
public:
    /**
     * @brief Replacement token for a PII type, e.g. "[EMAIL]"
     */
    [[nodiscard]] static std::string token_for(std::string_view type);

    /**
     * @brief Produce the redacted copy of a document
     * @param document Original text
     * @param resolved Disjoint matches sorted by start offset
     * @throws std::invalid_argument if resolved is unsorted, overlapping or
     *         out of range
     */
    [[nodiscard]] static std::string redact(
        std::string_view document,
        const std::vector<ResolvedMatch>& resolved);
};

} // namespace sentinel
