#include "detection/pattern_registry.hpp"
#include "detection/redactor.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace sentinel {

namespace {

/**
 * @brief Built-in detector table
 *
 * Order is priority: when two candidates start at the same offset with the
 * same length, the one declared first wins. Composite identifiers (GSTIN
 * embeds a PAN) are declared before their components.
 */
const std::vector<PatternRegistry::BuiltinInfo> kBuiltins = {
    {"GSTIN",
     R"(\b[0-9]{2}[A-Z]{5}[0-9]{4}[A-Z][1-9A-Z]Z[0-9A-Z]\b)",
     "Goods and services tax identification number"},
    {"PAN",
     R"(\b[A-Z]{5}[0-9]{4}[A-Z]\b)",
     "Permanent account number (tax ID)"},
    {"AADHAAR",
     R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)",
     "National ID number, 12 digits"},
    {"CREDIT_CARD",
     R"(\b\d{4}[\s-]?\d{4}[\s-]?\d{4}[\s-]?\d{4}\b)",
     "Payment card number, 16 digits"},
    {"PASSPORT",
     R"(\b[A-Z]\d{7}\b)",
     "Passport number"},
    {"VOTER_ID",
     R"(\b[A-Z]{3}\d{7}\b)",
     "Voter ID (EPIC) number"},
    {"EMAIL",
     R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)",
     "Email address"},
    {"UPI",
     R"(\b[A-Za-z0-9._-]{2,256}@[A-Za-z]{2,64}\b)",
     "Bank-transfer (UPI) handle"},
    {"PHONE",
     R"((?:\+91[\s-]?|\b)[6-9]\d{9}\b|(?:\+\d{1,3}[\s.-]?)?(?:\(\d{3}\)\s?|\b\d{3}[\s.-])?\b\d{3}[\s.-]\d{4}\b)",
     "Phone number (mobile or local format)"},
    {"DOB",
     R"(\b\d{2}[-/.]\d{2}[-/.]\d{4}\b)",
     "Date of birth"},
    {"ATM_PIN",
     R"(\b\d{4,6}\b)",
     "ATM PIN"},
    {"CVV",
     R"(\b\d{3}\b)",
     "Card verification value"},
};

RE2::Options engine_options() {
    RE2::Options options;
    options.set_log_errors(false);
    return options;
}

} // anonymous namespace

// ============================================================================
// CompileResult
// ============================================================================

std::string CompileResult::error_message() const {
    std::string message;
    for (const auto& r : rejections) {
        if (!message.empty()) message += "; ";
        message += std::format("{}: {}", r.name.empty() ? "<custom_patterns>" : r.name, r.reason);
    }
    return message;
}

ErrorCategory CompileResult::error_category() const {
    if (success) return ErrorCategory::NONE;
    for (const auto& r : rejections) {
        if (r.category != ErrorCategory::PATTERN_COMPLEXITY_REJECTED) {
            return ErrorCategory::INVALID_PATTERN;
        }
    }
    return rejections.empty() ? ErrorCategory::INVALID_PATTERN
                              : ErrorCategory::PATTERN_COMPLEXITY_REJECTED;
}

// ============================================================================
// PatternRegistry
// ============================================================================

PatternRegistry::PatternRegistry(const Config& config)
    : config_(config), guard_(config.guard) {

    // Compile once; every PatternSet shares these regex objects.
    std::vector<PatternSpec> specs;
    specs.reserve(kBuiltins.size());
    for (const auto& b : kBuiltins) {
        PatternSpec spec;
        spec.type = b.type;
        spec.source = PatternSource::BUILTIN;
        spec.regex_source = b.regex;
        spec.regex = std::make_shared<const RE2>(b.regex, engine_options());
        if (!spec.regex->ok()) {
            throw std::runtime_error(std::format("built-in pattern {} does not compile: {}",
                                                 b.type, spec.regex->error()));
        }
        specs.emplace_back(std::move(spec));
    }
    builtin_set_ = PatternSet(std::move(specs));
}

const std::vector<PatternRegistry::BuiltinInfo>& PatternRegistry::builtin_catalog() {
    return kBuiltins;
}

bool PatternRegistry::is_builtin_type(std::string_view type) const {
    const std::string upper = utils::to_upper(type);
    return builtin_set_.find(upper) != nullptr;
}

std::optional<std::string> PatternRegistry::validate_name(const std::string& normalized) const {
    if (normalized.empty()) {
        return "pattern name is empty";
    }
    if (normalized.size() > config_.max_name_length) {
        return std::format("pattern name exceeds {} characters", config_.max_name_length);
    }
    if (!std::isalpha(static_cast<unsigned char>(normalized[0]))) {
        return "pattern name must start with a letter";
    }
    for (const char c : normalized) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return std::format("pattern name contains invalid character '{}'", c);
        }
    }
    return std::nullopt;
}

CompileResult PatternRegistry::compile(const CustomPatternList& custom) const {
    if (custom.empty()) {
        return CompileResult::ok(builtin_set_);
    }

    std::vector<PatternRejection> rejections;

    if (custom.size() > config_.max_custom_patterns) {
        rejections.push_back({"", ErrorCategory::INVALID_PATTERN,
            std::format("{} custom patterns supplied, limit is {}",
                        custom.size(), config_.max_custom_patterns)});
        return CompileResult::error(std::move(rejections));
    }

    std::vector<PatternSpec> specs = builtin_set_.specs();
    std::vector<std::string> custom_names;
    std::unordered_set<std::string> seen;

    for (const auto& [raw_name, source] : custom) {
        auto reject = [&](ErrorCategory category, std::string reason) {
            rejections.push_back({raw_name, category, std::move(reason)});
        };

        const std::string name = utils::to_upper(utils::trim(raw_name));

        if (auto err = validate_name(name)) {
            reject(ErrorCategory::INVALID_PATTERN, *err);
            continue;
        }
        if (is_builtin_type(name)) {
            reject(ErrorCategory::INVALID_PATTERN,
                   std::format("name collides with built-in type {}", name));
            continue;
        }
        if (!seen.insert(name).second) {
            reject(ErrorCategory::INVALID_PATTERN,
                   std::format("duplicate custom pattern name {}", name));
            continue;
        }
        if (source.empty()) {
            reject(ErrorCategory::INVALID_PATTERN, "regex is empty");
            continue;
        }
        if (source.size() > guard_.config().max_pattern_length) {
            reject(ErrorCategory::PATTERN_COMPLEXITY_REJECTED,
                   std::format("pattern length {} exceeds limit of {}",
                               source.size(), guard_.config().max_pattern_length));
            continue;
        }

        auto regex = std::make_shared<const RE2>(source, engine_options());
        if (!regex->ok()) {
            const bool too_large = regex->error_code() == RE2::ErrorPatternTooLarge ||
                                   regex->error_code() == RE2::ErrorRepeatSize;
            reject(too_large ? ErrorCategory::PATTERN_COMPLEXITY_REJECTED
                             : ErrorCategory::INVALID_PATTERN,
                   std::format("regex does not compile: {}", regex->error()));
            continue;
        }

        const auto analysis = guard_.analyze(source);
        if (!analysis.accepted) {
            reject(ErrorCategory::PATTERN_COMPLEXITY_REJECTED, analysis.reason);
            continue;
        }
        if (analysis.matches_empty) {
            reject(ErrorCategory::INVALID_PATTERN, "pattern can match the empty string");
            continue;
        }

        PatternSpec spec;
        spec.type = name;
        spec.source = PatternSource::CUSTOM;
        spec.regex_source = source;
        spec.regex = std::move(regex);
        specs.emplace_back(std::move(spec));
        custom_names.push_back(raw_name);
    }

    if (!rejections.empty()) {
        return CompileResult::error(std::move(rejections));
    }

    check_token_collisions(specs, custom_names, rejections);
    if (!rejections.empty()) {
        return CompileResult::error(std::move(rejections));
    }

    utils::log::debug(std::format("Compiled pattern set: {} built-in, {} custom",
                                  builtin_set_.size(), custom_names.size()));
    return CompileResult::ok(PatternSet(std::move(specs)));
}

void PatternRegistry::check_token_collisions(
    const std::vector<PatternSpec>& specs,
    const std::vector<std::string>& custom_names,
    std::vector<PatternRejection>& rejections) const {

    const size_t first_custom = builtin_set_.size();

    for (size_t i = first_custom; i < specs.size(); ++i) {
        const auto& custom = specs[i];
        const std::string& raw_name = custom_names[i - first_custom];

        // Its own token must survive every active pattern
        const std::string own_token = Redactor::token_for(custom.type);
        bool rejected = false;
        for (const auto& spec : specs) {
            if (RE2::PartialMatch(own_token, *spec.regex)) {
                rejections.push_back({raw_name, ErrorCategory::INVALID_PATTERN,
                    spec.type == custom.type
                        ? std::format("pattern matches its own redaction token {}", own_token)
                        : std::format("redaction token {} would be matched by pattern {}",
                                      own_token, spec.type)});
                rejected = true;
                break;
            }
        }
        if (rejected) continue;

        // It must not match any other token in the set
        for (const auto& spec : specs) {
            if (spec.type == custom.type) continue;
            const std::string token = Redactor::token_for(spec.type);
            if (RE2::PartialMatch(token, *custom.regex)) {
                rejections.push_back({raw_name, ErrorCategory::INVALID_PATTERN,
                    std::format("pattern matches redaction token {}", token)});
                break;
            }
        }
    }
}

} // namespace sentinel
