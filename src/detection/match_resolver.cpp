#include "detection/match_resolver.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace sentinel {

namespace {

// UTF-8 continuation bytes are 10xxxxxx
bool on_code_point_boundary(std::string_view text, size_t pos) {
    return pos >= text.size() || (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

size_t next_code_point(std::string_view text, size_t pos) {
    ++pos;
    while (pos < text.size() && !on_code_point_boundary(text, pos)) ++pos;
    return pos;
}

} // anonymous namespace

std::vector<RawMatch> MatchResolver::collect(
    std::string_view document,
    const PatternSet& patterns) {

    std::vector<RawMatch> raw;
    const re2::StringPiece text(document.data(), document.size());

    for (const auto& spec : patterns) {
        if (!spec.regex) continue;
        const RE2& re = *spec.regex;
        if (!re.ok()) {
            throw std::runtime_error(std::format("pattern {} is not usable: {}", spec.type, re.error()));
        }

        size_t pos = 0;
        re2::StringPiece hit;
        while (pos <= document.size() &&
               re.Match(text, pos, document.size(), RE2::UNANCHORED, &hit, 1)) {
            const auto start = static_cast<size_t>(hit.data() - text.data());
            const size_t length = hit.size();
            if (length == 0) {
                pos = next_code_point(document, start);
                continue;
            }
            pos = start + length;

            // A byte-level construct such as \C can cut a character in half
            if (!on_code_point_boundary(document, start) ||
                !on_code_point_boundary(document, start + length)) {
                continue;
            }

            RawMatch match;
            match.type = spec.type;
            match.start = start;
            match.end = start + length;
            match.text = std::string(document.substr(start, length));
            match.rank = spec.rank;
            raw.emplace_back(std::move(match));
        }
    }
    return raw;
}

std::vector<ResolvedMatch> MatchResolver::select(std::vector<RawMatch> raw) {
    std::sort(raw.begin(), raw.end(), [](const RawMatch& a, const RawMatch& b) {
        if (a.start != b.start) return a.start < b.start;
        if (a.length() != b.length()) return a.length() > b.length();
        return a.rank < b.rank;
    });

    std::vector<ResolvedMatch> resolved;
    size_t accepted_end = 0;

    // Candidates arrive in start order and accepted spans are disjoint, so
    // only the last accepted end can intersect the next candidate.
    for (auto& m : raw) {
        if (!resolved.empty() && m.start < accepted_end) continue;
        accepted_end = m.end;
        resolved.emplace_back(std::move(m.type), m.start, m.end, std::move(m.text));
    }
    return resolved;
}

std::vector<ResolvedMatch> MatchResolver::resolve(
    std::string_view document,
    const PatternSet& patterns) {
    return select(collect(document, patterns));
}

} // namespace sentinel
