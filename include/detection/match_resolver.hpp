#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief Runs a pattern set over one document and resolves overlaps
 *
 * 1. Each pattern is scanned independently, greedy left-to-right, yielding
 *    its non-overlapping hits (RawMatch).
 * 2. All hits are ordered by start, then longer first, then pattern rank.
 * 3. A single sweep accepts a hit iff it starts at or after the end of the
 *    last accepted hit.
 *
 * The result is pairwise disjoint and sorted by start. Matching runs on RE2,
 * so time is linear in the document and no stack depth depends on it. Hits
 * never begin or end inside a UTF-8 sequence. Stateless; the pattern set is
 * only read, so concurrent calls need no coordination.
 */
class MatchResolver {
public:
    /**
     * @brief Collect every hit of every pattern (overlaps included)
     * @throws std::runtime_error if a pattern in the set failed to compile
     */
    [[nodiscard]] static std::vector<RawMatch> collect(
        std::string_view document,
        const PatternSet& patterns);

    /**
     * @brief Reduce raw hits to the disjoint resolved set
     */
    [[nodiscard]] static std::vector<ResolvedMatch> select(std::vector<RawMatch> raw);

    /**
     * @brief collect() + select()
     * @throws std::runtime_error if a pattern in the set failed to compile
     */
    [[nodiscard]] static std::vector<ResolvedMatch> resolve(
        std::string_view document,
        const PatternSet& patterns);
};

} // namespace sentinel
