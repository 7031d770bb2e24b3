#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sentinel {

/**
 * @brief Structural complexity check for caller-supplied regexes
 *
 * Keeps caller patterns to shapes with bounded, unambiguous repetition so
 * the compiled program stays small and every match has one parse.
 *
 * Rejected shapes:
 * - Back-references (\1..\9, \k<name>)
 * - Nested quantifiers: (a+)+, (a*){10,}, (?:x\d+)*
 * - Unbounded repetition of a subexpression that can match empty: (a?)*
 * - Unbounded repetition of an alternation whose branches can start with
 *   the same character: (a|aa)*, (\d|\w)+
 * - Bounded repetition whose nested product exceeds max_repetition
 * - Sources longer than max_pattern_length
 *
 * First-character sets are over-approximated (\p{..}, \x{..}, POSIX classes
 * count as any byte). The analyzer assumes the source already compiled.
 */
class RegexGuard {
public:
    struct Config {
        size_t max_pattern_length = 512;
        uint64_t max_repetition = 1000;
        // Bounded quantifiers with an upper bound at or above this count as
        // unbounded when checking for nesting.
        uint32_t nested_bound_limit = 10;
    };

    struct Analysis {
        bool accepted = true;
        std::string reason;             // Set when !accepted
        bool matches_empty = false;     // Whole pattern can match ""
    };

    RegexGuard() : RegexGuard(Config{}) {}
    explicit RegexGuard(const Config& config);

    [[nodiscard]] Analysis analyze(std::string_view source) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace sentinel
