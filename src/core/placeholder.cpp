#include "core/placeholder.hpp"
#include "core/utils.hpp"

#include <format>

namespace airlock::placeholder {

namespace {

inline char ascii_upper(char c) {
    return utils::is_ascii_lower(c) ? static_cast<char>(c - 'a' + 'A') : c;
}

inline bool is_index_separator(char c) {
    return c == '_' || c == '-' || c == ':';
}

} // anonymous namespace

std::string make(std::string_view entity_type, uint32_t index) {
    return std::format("<{}_{}>", entity_type, index);
}

bool is_valid_entity_type(std::string_view entity_type) {
    if (entity_type.empty() || entity_type.size() > kMaxEntityTypeLength) return false;
    if (entity_type.front() == '_' || entity_type.back() == '_') return false;

    char prev = '\0';
    for (const char c : entity_type) {
        if (c == '_') {
            if (prev == '_') return false;
        } else if (!utils::is_ascii_upper(c)) {
            return false;
        }
        prev = c;
    }
    return true;
}

std::optional<std::string> normalize_entity_type(std::string_view raw) {
    std::string out = utils::to_upper(raw);
    for (char& c : out) {
        if (c == '-' || c == ' ') c = '_';
    }
    if (!is_valid_entity_type(out)) return std::nullopt;
    return out;
}

std::optional<std::pair<std::string, uint32_t>> parse_canonical(std::string_view token) {
    const auto r = scan_at(token, 0);
    if (r.status != ScanStatus::MATCH
        || r.match.end != token.size()
        || r.match.match_kind != FuzzyMatchKind::EXACT) {
        return std::nullopt;
    }
    return std::make_pair(r.match.resolved_type, r.match.resolved_index);
}

ScanResult scan_at(std::string_view text, size_t pos) {
    ScanResult result;
    if (pos >= text.size()) return result;

    // Bounded window: a token never extends past kMaxPlaceholderLength bytes
    const std::string_view v = text.substr(pos, kMaxPlaceholderLength);
    const bool window_reaches_end = (pos + v.size() == text.size());

    // Running off the window is PARTIAL only when more input could still arrive
    const auto ran_out = [&]() {
        result.status = window_reaches_end ? ScanStatus::PARTIAL : ScanStatus::NO_MATCH;
        return result;
    };

    size_t i = 0;
    std::string_view close;
    const char open = v[0];
    if (open == '<') {
        close = ">";
        i = 1;
    } else if (open == '[') {
        close = "]";
        i = 1;
    } else if (open == '{') {
        if (v.size() < 2) return ran_out();
        if (v[1] == '{') {
            close = "}}";
            i = 2;
        } else {
            close = "}";
            i = 1;
        }
    } else {
        return result;
    }

    bool padded = false;
    bool separator_variant = false;
    bool lowercase = false;

    size_t pad = 0;
    while (i < v.size() && v[i] == ' ' && pad < kMaxPadding) { ++i; ++pad; }
    padded = pad > 0;
    if (i >= v.size()) return ran_out();

    std::string type;
    uint32_t index = 0;

    while (true) {
        // Letter run of the type name
        if (!utils::is_ascii_alpha(v[i])) return result;
        while (i < v.size() && utils::is_ascii_alpha(v[i])) {
            if (utils::is_ascii_lower(v[i])) lowercase = true;
            type += ascii_upper(v[i]);
            ++i;
        }
        if (type.size() > kMaxEntityTypeLength) return result;
        if (i >= v.size()) return ran_out();

        // Separator: "_", "-", ":", " ", optionally with one space around the char
        const size_t sep_start = i;
        bool has_space = false;
        bool has_char = false;
        char sep_char = ' ';
        if (v[i] == ' ') {
            has_space = true;
            if (++i >= v.size()) return ran_out();
        }
        if (is_index_separator(v[i])) {
            has_char = true;
            sep_char = v[i];
            if (++i >= v.size()) return ran_out();
            if (v[i] == ' ') {
                has_space = true;
                if (++i >= v.size()) return ran_out();
            }
        }
        if (!has_char && !has_space) return result;
        if (v.substr(sep_start, i - sep_start) != "_") separator_variant = true;

        if (utils::is_ascii_alpha(v[i])) {
            // Type continues ("CREDIT_CARD"); ':' only ever precedes the index
            if (sep_char == ':') return result;
            type += '_';
            continue;
        }

        // Index: positive, no leading zero
        if (!utils::is_ascii_digit(v[i]) || v[i] == '0') return result;
        size_t digits = 0;
        uint64_t value = 0;
        while (i < v.size() && utils::is_ascii_digit(v[i])) {
            if (++digits > kMaxIndexDigits) return result;
            value = value * 10 + static_cast<uint64_t>(v[i] - '0');
            ++i;
        }
        if (i >= v.size()) return ran_out();
        index = static_cast<uint32_t>(value);
        break;
    }

    if (type.size() > kMaxEntityTypeLength) return result;

    pad = 0;
    while (i < v.size() && v[i] == ' ' && pad < kMaxPadding) { ++i; ++pad; }
    if (pad > 0) padded = true;

    for (const char c : close) {
        if (i >= v.size()) return ran_out();
        if (v[i] != c) return result;
        ++i;
    }

    result.status = ScanStatus::MATCH;
    auto& m = result.match;
    m.start = pos;
    m.end = pos + i;
    m.raw_span = std::string(v.substr(0, i));
    m.resolved_type = type;
    m.resolved_index = index;
    m.normalized_form = make(type, index);

    if (open != '<') {
        m.match_kind = FuzzyMatchKind::BRACKET;
    } else if (padded || separator_variant) {
        m.match_kind = FuzzyMatchKind::SEPARATOR;
    } else if (lowercase) {
        m.match_kind = FuzzyMatchKind::CASE;
    } else {
        m.match_kind = FuzzyMatchKind::EXACT;
    }
    return result;
}

} // namespace airlock::placeholder
