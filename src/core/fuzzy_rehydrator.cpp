#include "core/fuzzy_rehydrator.hpp"
#include "core/placeholder.hpp"

#include <algorithm>

namespace airlock {

namespace {

inline bool is_open_bracket(char c) {
    return c == '<' || c == '[' || c == '{';
}

} // anonymous namespace

std::vector<FuzzyMatch> FuzzyRehydrator::find_all(std::string_view text) const {
    std::vector<FuzzyMatch> matches;

    size_t i = 0;
    while (i < text.size()) {
        if (!is_open_bracket(text[i]) || (!fuzzy_enabled_ && text[i] != '<')) {
            ++i;
            continue;
        }
        auto r = placeholder::scan_at(text, i);
        if (r.status == placeholder::ScanStatus::MATCH
            && (fuzzy_enabled_ || r.match.match_kind == FuzzyMatchKind::EXACT)) {
            i = r.match.end;
            matches.push_back(std::move(r.match));
            continue;
        }
        ++i;
    }
    return matches;
}

std::optional<std::string> FuzzyRehydrator::normalize(std::string_view token) const {
    const auto r = placeholder::scan_at(token, 0);
    if (r.status != placeholder::ScanStatus::MATCH || r.match.end != token.size()) {
        return std::nullopt;
    }
    if (!fuzzy_enabled_ && r.match.match_kind != FuzzyMatchKind::EXACT) {
        return std::nullopt;
    }
    return r.match.normalized_form;
}

size_t FuzzyRehydrator::pending_token_start(std::string_view text) const {
    const size_t window = std::min(text.size(), placeholder::kMaxPlaceholderLength);
    for (size_t i = text.size() - window; i < text.size(); ++i) {
        if (!is_open_bracket(text[i])) continue;
        if (placeholder::scan_at(text, i).status == placeholder::ScanStatus::PARTIAL) {
            return i;
        }
    }
    return std::string_view::npos;
}

} // namespace airlock
