#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "detection/regex_guard.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel {

/**
 * @brief One rejected custom pattern entry
 */
struct PatternRejection {
    std::string name;                   // As supplied by the caller
    ErrorCategory category = ErrorCategory::INVALID_PATTERN;
    std::string reason;
};

/**
 * @brief Outcome of compiling an active pattern set
 *
 * Either the complete set (built-ins + every custom entry) or the list of
 * offending entries. A partial set is never returned.
 */
struct CompileResult {
    bool success = false;
    PatternSet patterns;
    std::vector<PatternRejection> rejections;

    static CompileResult ok(PatternSet set) {
        CompileResult result;
        result.success = true;
        result.patterns = std::move(set);
        return result;
    }

    static CompileResult error(std::vector<PatternRejection> rejected) {
        CompileResult result;
        result.success = false;
        result.rejections = std::move(rejected);
        return result;
    }

    /**
     * @brief "NAME: reason; NAME: reason" summary of all rejections
     */
    [[nodiscard]] std::string error_message() const;

    /**
     * @brief PATTERN_COMPLEXITY_REJECTED if every rejection is a complexity
     * rejection, INVALID_PATTERN otherwise
     */
    [[nodiscard]] ErrorCategory error_category() const;
};

/**
 * @brief Built-in detector catalog + custom pattern compiler
 *
 * Built-ins are compiled once in the constructor and shared (immutable) by
 * every PatternSet this registry produces. Declaration order of the built-in
 * table is the tie-break priority used by MatchResolver.
 *
 * Custom entries are validated independently:
 * 1. Name is an identifier ([A-Za-z][A-Za-z0-9_]*), normalized to uppercase
 * 2. Name does not collide (case-insensitive) with a built-in or earlier entry
 * 3. Regex compiles (RE2 syntax)
 * 4. RegexGuard accepts it and it cannot match the empty string
 * 5. No active pattern matches a redaction token of the active set
 */
class PatternRegistry {
public:
    struct Config {
        RegexGuard::Config guard;
        size_t max_custom_patterns = 32;
        size_t max_name_length = 64;
    };

    struct BuiltinInfo {
        const char* type;
        const char* regex;
        const char* description;
    };

    PatternRegistry() : PatternRegistry(Config{}) {}
    explicit PatternRegistry(const Config& config);

    /**
     * @brief Compile built-ins + custom entries into an active set
     * @param custom Ordered name -> regex source entries (may be empty)
     */
    [[nodiscard]] CompileResult compile(const CustomPatternList& custom) const;

    /**
     * @brief Active set containing only the built-in detectors
     */
    [[nodiscard]] const PatternSet& builtin_set() const { return builtin_set_; }

    [[nodiscard]] bool is_builtin_type(std::string_view type) const;

    [[nodiscard]] static const std::vector<BuiltinInfo>& builtin_catalog();

    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] std::optional<std::string> validate_name(const std::string& normalized) const;

    void check_token_collisions(const std::vector<PatternSpec>& specs,
                                const std::vector<std::string>& custom_names,
                                std::vector<PatternRejection>& rejections) const;

    Config config_;
    RegexGuard guard_;
    PatternSet builtin_set_;
};

} // namespace sentinel
