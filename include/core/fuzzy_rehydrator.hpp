#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief Finds placeholder tokens in LLM output, including reformatted ones
 *
 * Recognized variants of <PERSON_1> (when fuzzy matching is enabled):
 * - case:      <Person_1>, <person_1>
 * - separator: <PERSON-1>, <PERSON 1>, <PERSON:1>, < PERSON_1 >
 * - bracket:   [PERSON_1], {PERSON_1}, {{PERSON_1}}
 *
 * The grammar is bounded; there is no edit-distance matching.
 */
class FuzzyRehydrator {
public:
    explicit FuzzyRehydrator(bool fuzzy_enabled = true) : fuzzy_enabled_(fuzzy_enabled) {}

    [[nodiscard]] bool fuzzy_enabled() const { return fuzzy_enabled_; }

    /**
     * @brief All tokens left to right, non-overlapping
     *
     * Canonical tokens are always reported; variants only when fuzzy
     * matching is on.
     */
    [[nodiscard]] std::vector<FuzzyMatch> find_all(std::string_view text) const;

    /**
     * @brief Canonical <TYPE_N> for a single token, or nullopt
     */
    [[nodiscard]] std::optional<std::string> normalize(std::string_view token) const;

    /**
     * @brief Offset of the earliest unfinished token in the trailing window
     * @return npos if no suffix of text can still grow into a token
     */
    [[nodiscard]] size_t pending_token_start(std::string_view text) const;

private:
    bool fuzzy_enabled_;
};

} // namespace airlock
