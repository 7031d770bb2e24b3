#include "detection/regex_guard.hpp"

#include <algorithm>
#include <bitset>
#include <cctype>
#include <format>
#include <limits>
#include <optional>
#include <vector>

namespace sentinel {

namespace {

constexpr uint64_t kUnbounded = std::numeric_limits<uint64_t>::max();

// Set of bytes a subexpression can begin with
using CharSet = std::bitset<256>;

struct Rejection {
    std::string reason;
};

CharSet char_range(unsigned lo, unsigned hi) {
    CharSet set;
    for (unsigned c = lo; c <= hi; ++c) set.set(c);
    return set;
}

CharSet digit_chars() {
    return char_range('0', '9');
}

CharSet word_chars() {
    CharSet set = char_range('a', 'z') | char_range('A', 'Z') | digit_chars();
    set.set('_');
    return set;
}

CharSet space_chars() {
    CharSet set;
    for (const char c : {' ', '\t', '\n', '\v', '\f', '\r'}) {
        set.set(static_cast<unsigned char>(c));
    }
    return set;
}

// Any byte of a multi-byte UTF-8 sequence
CharSet high_bytes() {
    return char_range(0x80, 0xFF);
}

CharSet all_chars() {
    return CharSet{}.set();
}

CharSet single(unsigned char c) {
    CharSet set;
    set.set(c);
    return set;
}

void fold_case(CharSet& set) {
    for (unsigned c = 'a'; c <= 'z'; ++c) {
        const unsigned upper = c - 'a' + 'A';
        if (set.test(c) || set.test(upper)) {
            set.set(c);
            set.set(upper);
        }
    }
}

/**
 * @brief Structural summary of a parsed subexpression
 */
struct NodeInfo {
    bool nullable = true;           // Can match the empty string
    bool zero_width = true;         // Consists only of assertions
    bool unbounded = false;         // Contains *, + or {n,}
    uint64_t repeat_factor = 1;     // Product of nested bounded upper bounds
    CharSet first;                  // Bytes a non-empty match can start with
    bool overlapping_branches = false;
};

struct Quantifier {
    uint64_t min = 1;
    uint64_t max = 1;
};

class Analyzer {
public:
    Analyzer(std::string_view source, const RegexGuard::Config& config)
        : src_(source), config_(config) {}

    NodeInfo run() {
        NodeInfo info = parse_alternation();
        if (!at_end()) {
            throw Rejection{std::format("unbalanced ')' at offset {}", pos_)};
        }
        return info;
    }

private:
    [[nodiscard]] bool at_end() const { return pos_ >= src_.size(); }
    [[nodiscard]] char peek() const { return at_end() ? '\0' : src_[pos_]; }

    NodeInfo parse_alternation() {
        NodeInfo result;
        std::vector<CharSet> branch_firsts;

        while (true) {
            NodeInfo branch = parse_sequence();
            branch_firsts.push_back(branch.first);

            if (branch_firsts.size() == 1) {
                result = branch;
            } else {
                result.nullable = result.nullable || branch.nullable;
                result.zero_width = result.zero_width && branch.zero_width;
                result.unbounded = result.unbounded || branch.unbounded;
                result.repeat_factor = std::max(result.repeat_factor, branch.repeat_factor);
                result.first |= branch.first;
            }

            if (peek() != '|') break;
            ++pos_;
        }

        result.overlapping_branches = false;
        for (size_t i = 0; i < branch_firsts.size() && !result.overlapping_branches; ++i) {
            for (size_t j = i + 1; j < branch_firsts.size(); ++j) {
                if ((branch_firsts[i] & branch_firsts[j]).any()) {
                    result.overlapping_branches = true;
                    break;
                }
            }
        }
        return result;
    }

    NodeInfo parse_sequence() {
        NodeInfo result;   // Empty sequence: nullable, zero-width
        while (!at_end() && peek() != '|' && peek() != ')') {
            NodeInfo item = apply_quantifier(parse_atom());
            if (result.nullable) result.first |= item.first;
            result.nullable = result.nullable && item.nullable;
            result.zero_width = result.zero_width && item.zero_width;
            result.unbounded = result.unbounded || item.unbounded;
            result.repeat_factor = std::max(result.repeat_factor, item.repeat_factor);
        }
        result.overlapping_branches = false;
        return result;
    }

    NodeInfo single_char(CharSet first) const {
        if (ignore_case_) fold_case(first);
        NodeInfo info;
        info.nullable = false;
        info.zero_width = false;
        info.first = first;
        return info;
    }

    static NodeInfo assertion() {
        return NodeInfo{};
    }

    NodeInfo parse_atom() {
        const char c = src_[pos_];
        switch (c) {
            case '(':
                return parse_group();
            case '[':
                return single_char(parse_class());
            case '.': {
                ++pos_;
                CharSet any = all_chars();
                any.reset('\n');
                return single_char(any);
            }
            case '\\':
                return parse_escape();
            case '^':
            case '$':
                ++pos_;
                return assertion();
            case '*':
            case '+':
            case '?':
                throw Rejection{std::format("quantifier without operand at offset {}", pos_)};
            default:
                return single_char(literal_char());
        }
    }

    // Consumes one literal character; a UTF-8 sequence counts as one
    CharSet literal_char() {
        const auto c = static_cast<unsigned char>(src_[pos_++]);
        if (c < 0x80) return single(c);
        while (!at_end() && (static_cast<unsigned char>(peek()) & 0xC0) == 0x80) ++pos_;
        return single(c);
    }

    NodeInfo parse_group() {
        const size_t open = pos_;
        ++pos_;  // '('
        bool lookaround = false;
        if (peek() == '?') {
            ++pos_;
            const char kind = peek();
            if (kind == ':') {
                ++pos_;
            } else if (kind == 'P' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '<') {
                while (!at_end() && peek() != '>') ++pos_;
                if (at_end()) {
                    throw Rejection{std::format("unterminated group name at offset {}", open)};
                }
                ++pos_;
            } else if (std::isalpha(static_cast<unsigned char>(kind)) || kind == '-') {
                // Flag group: (?i) or (?i:...)
                while (!at_end() && peek() != ':' && peek() != ')') {
                    if (peek() == 'i') ignore_case_ = true;
                    ++pos_;
                }
                if (at_end()) {
                    throw Rejection{std::format("unterminated flag group at offset {}", open)};
                }
                if (peek() == ')') {
                    ++pos_;
                    return assertion();
                }
                ++pos_;
            } else if (kind == '=' || kind == '!') {
                ++pos_;
                lookaround = true;
            } else if (kind == '<') {
                ++pos_;
                if (peek() == '=' || peek() == '!') {
                    ++pos_;
                    lookaround = true;
                } else {
                    // Named group: skip to '>'
                    while (!at_end() && peek() != '>') ++pos_;
                    if (at_end()) {
                        throw Rejection{std::format("unterminated group name at offset {}", open)};
                    }
                    ++pos_;
                }
            }
        }

        NodeInfo inner = parse_alternation();
        if (peek() != ')') {
            throw Rejection{std::format("unterminated group at offset {}", open)};
        }
        ++pos_;

        if (lookaround) {
            NodeInfo info = assertion();
            info.unbounded = inner.unbounded;
            info.repeat_factor = inner.repeat_factor;
            return info;
        }
        return inner;
    }

    CharSet parse_class() {
        const size_t open = pos_;
        ++pos_;  // '['
        bool negated = false;
        if (peek() == '^') {
            negated = true;
            ++pos_;
        }

        CharSet set;
        while (!at_end() && peek() != ']') {
            if (peek() == '[' && pos_ + 1 < src_.size() && src_[pos_ + 1] == ':') {
                const size_t close = src_.find(":]", pos_ + 2);
                if (close == std::string_view::npos) {
                    throw Rejection{std::format("unterminated character class at offset {}", open)};
                }
                pos_ = close + 2;
                set.set();
                continue;
            }

            CharSet item;
            const auto lo = class_char(item);
            if (lo && peek() == '-' && pos_ + 1 < src_.size() && src_[pos_ + 1] != ']') {
                ++pos_;
                CharSet hi_item;
                const auto hi = class_char(hi_item);
                if (hi && *hi >= *lo) {
                    set |= char_range(*lo, *hi);
                } else {
                    set |= hi_item | single(*lo) | single('-');
                    if (hi) set.set(*hi);
                }
                continue;
            }
            if (lo) {
                set.set(*lo);
            } else {
                set |= item;
            }
        }
        if (at_end()) {
            throw Rejection{std::format("unterminated character class at offset {}", open)};
        }
        ++pos_;  // ']'

        if (ignore_case_) fold_case(set);
        return negated ? ~set : set;
    }

    /**
     * @brief One class member: returns the byte for a plain character, or
     * fills @p item for shorthand classes and multi-byte characters
     */
    std::optional<unsigned char> class_char(CharSet& item) {
        const auto c = static_cast<unsigned char>(src_[pos_]);
        if (c == '\\') {
            ++pos_;
            if (at_end()) {
                throw Rejection{"trailing backslash"};
            }
            return escape_char(item);
        }
        if (c >= 0x80) {
            literal_char();
            item = high_bytes();
            return std::nullopt;
        }
        ++pos_;
        return c;
    }

    /**
     * @brief Escape body after the backslash, same contract as class_char()
     */
    std::optional<unsigned char> escape_char(CharSet& item) {
        const char e = src_[pos_++];
        switch (e) {
            case 'd': item = digit_chars(); return std::nullopt;
            case 'D': item = ~digit_chars(); return std::nullopt;
            case 'w': item = word_chars(); return std::nullopt;
            case 'W': item = ~word_chars(); return std::nullopt;
            case 's': item = space_chars(); return std::nullopt;
            case 'S': item = ~space_chars(); return std::nullopt;
            case 'n': return '\n';
            case 't': return '\t';
            case 'r': return '\r';
            case 'f': return '\f';
            case 'v': return '\v';
            case '0': return '\0';
            case 'x': {
                if (peek() == '{') {
                    skip_braces();
                    item = all_chars();
                    return std::nullopt;
                }
                if (pos_ + 2 <= src_.size() &&
                    std::isxdigit(static_cast<unsigned char>(src_[pos_])) &&
                    std::isxdigit(static_cast<unsigned char>(src_[pos_ + 1]))) {
                    const auto value = static_cast<unsigned char>(
                        std::stoi(std::string(src_.substr(pos_, 2)), nullptr, 16));
                    pos_ += 2;
                    return value;
                }
                item = all_chars();
                return std::nullopt;
            }
            case 'p':
            case 'P':
                if (peek() == '{') {
                    skip_braces();
                } else if (!at_end()) {
                    ++pos_;
                }
                item = all_chars();
                return std::nullopt;
            default:
                if (std::isalnum(static_cast<unsigned char>(e))) {
                    item = all_chars();
                    return std::nullopt;
                }
                return static_cast<unsigned char>(e);
        }
    }

    void skip_braces() {
        const size_t close = src_.find('}', pos_);
        if (close == std::string_view::npos) {
            throw Rejection{std::format("unterminated escape at offset {}", pos_)};
        }
        pos_ = close + 1;
    }

    NodeInfo parse_escape() {
        ++pos_;  // '\'
        if (at_end()) {
            throw Rejection{"trailing backslash"};
        }
        const char c = peek();

        if (c >= '1' && c <= '9') {
            throw Rejection{"back-references are not supported"};
        }
        if (c == 'k' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '<') {
            throw Rejection{"back-references are not supported"};
        }
        if (c == 'b' || c == 'B' || c == 'A' || c == 'z') {
            ++pos_;
            return assertion();
        }

        CharSet item;
        const auto byte = escape_char(item);
        return single_char(byte ? single(*byte) : item);
    }

    std::optional<uint64_t> parse_number() {
        if (at_end() || !std::isdigit(static_cast<unsigned char>(peek()))) {
            return std::nullopt;
        }
        uint64_t value = 0;
        while (!at_end() && std::isdigit(static_cast<unsigned char>(peek()))) {
            value = value * 10 + static_cast<uint64_t>(peek() - '0');
            if (value > 1'000'000'000ULL) {
                throw Rejection{"repetition count too large"};
            }
            ++pos_;
        }
        return value;
    }

    std::optional<Quantifier> parse_quantifier() {
        if (at_end()) return std::nullopt;
        const char c = peek();
        Quantifier q;
        if (c == '*') {
            ++pos_;
            q = {0, kUnbounded};
        } else if (c == '+') {
            ++pos_;
            q = {1, kUnbounded};
        } else if (c == '?') {
            ++pos_;
            q = {0, 1};
        } else if (c == '{') {
            const size_t save = pos_;
            ++pos_;
            const auto lo = parse_number();
            if (!lo) {
                pos_ = save;
                return std::nullopt;
            }
            q.min = *lo;
            q.max = *lo;
            if (peek() == ',') {
                ++pos_;
                const auto hi = parse_number();
                q.max = hi ? *hi : kUnbounded;
            }
            if (peek() != '}') {
                pos_ = save;
                return std::nullopt;
            }
            ++pos_;
        } else {
            return std::nullopt;
        }

        if (peek() == '?') ++pos_;  // Lazy suffix
        return q;
    }

    NodeInfo apply_quantifier(NodeInfo atom) {
        const size_t at = pos_;
        const auto q = parse_quantifier();
        if (!q) return atom;

        if (atom.zero_width) {
            return atom;
        }

        const bool unbounded = q->max == kUnbounded;
        const bool wide = unbounded || q->max >= config_.nested_bound_limit;

        if (wide && atom.unbounded) {
            throw Rejection{std::format(
                "nested quantifier at offset {}: repeated subexpression already "
                "contains an unbounded quantifier", at)};
        }
        if (unbounded && atom.nullable) {
            throw Rejection{std::format(
                "unbounded quantifier at offset {} over a subexpression that can match empty", at)};
        }
        if (unbounded && atom.overlapping_branches) {
            throw Rejection{std::format(
                "unbounded quantifier at offset {} over an alternation whose branches "
                "can start with the same character", at)};
        }

        const uint64_t bound = unbounded ? q->min : q->max;
        if (bound > 0 && atom.repeat_factor > config_.max_repetition / bound) {
            throw Rejection{std::format(
                "bounded repetition at offset {} exceeds {} iterations", at, config_.max_repetition)};
        }

        NodeInfo result = atom;
        result.repeat_factor = std::max<uint64_t>(1, atom.repeat_factor * bound);
        result.unbounded = atom.unbounded || unbounded;
        result.nullable = atom.nullable || q->min == 0;
        result.zero_width = false;
        result.overlapping_branches = false;
        return result;
    }

    std::string_view src_;
    size_t pos_ = 0;
    const RegexGuard::Config& config_;
    bool ignore_case_ = false;
};

} // anonymous namespace

RegexGuard::RegexGuard(const Config& config)
    : config_(config) {}

RegexGuard::Analysis RegexGuard::analyze(std::string_view source) const {
    Analysis analysis;

    if (source.size() > config_.max_pattern_length) {
        analysis.accepted = false;
        analysis.reason = std::format("pattern length {} exceeds limit of {}",
                                      source.size(), config_.max_pattern_length);
        return analysis;
    }

    try {
        Analyzer analyzer(source, config_);
        const NodeInfo info = analyzer.run();
        analysis.matches_empty = info.nullable;
    } catch (const Rejection& r) {
        analysis.accepted = false;
        analysis.reason = r.reason;
    }
    return analysis;
}

} // namespace sentinel
