#include "core/deanonymizer.hpp"

#include <algorithm>
#include <unordered_set>

namespace airlock {

Deanonymizer::Deanonymizer(const Config& config)
    : config_(config), rehydrator_(config.fuzzy_matching) {}

DeanonymizationResult Deanonymizer::deanonymize(std::string_view text,
                                                const SessionMapping& mapping) const {
    return run(text, &mapping);
}

DeanonymizationResult Deanonymizer::deanonymize_without_mapping(std::string_view text) const {
    return run(text, nullptr);
}

DeanonymizationResult Deanonymizer::run(std::string_view text,
                                        const SessionMapping* mapping) const {
    DeanonymizationResult result;
    const auto matches = rehydrator_.find_all(text);
    if (matches.empty()) {
        result.text = std::string(text);
        return result;
    }

    std::unordered_set<std::string> reported;
    result.text.reserve(text.size());

    size_t cursor = 0;
    for (const auto& m : matches) {
        result.text.append(text.substr(cursor, m.start - cursor));
        cursor = m.end;

        if (mapping) {
            if (auto original = mapping->get_original(m.normalized_form)) {
                result.text += *original;
                ++result.replaced_count;
                result.resolved.push_back(m);
                continue;
            }
        }

        result.text += m.raw_span;

        // Without a mapping there is no type table to filter on
        const bool placeholder_like = !mapping
            || m.match_kind == FuzzyMatchKind::EXACT
            || mapping->has_entity_type(m.resolved_type);
        if (placeholder_like && reported.insert(m.raw_span).second) {
            result.unresolved.push_back(m.raw_span);
        }
    }
    result.text.append(text.substr(cursor));

    result.is_complete = result.unresolved.empty();
    return result;
}

bool Deanonymizer::has_placeholders(std::string_view text) const {
    return !rehydrator_.find_all(text).empty();
}

std::vector<std::string> Deanonymizer::extract_placeholders(std::string_view text) const {
    std::vector<std::string> out;
    for (const auto& m : rehydrator_.find_all(text)) {
        if (std::find(out.begin(), out.end(), m.normalized_form) == out.end()) {
            out.push_back(m.normalized_form);
        }
    }
    return out;
}

} // namespace airlock
