#pragma once

#include "core/fuzzy_rehydrator.hpp"
#include "core/session_mapping.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

struct DeanonymizationResult {
    std::string text;
    size_t replaced_count = 0;
    bool is_complete = true;
    std::vector<std::string> unresolved;    // literal tokens, first-seen order, no repeats
    std::vector<FuzzyMatch> resolved;       // every substituted occurrence
};

/**
 * @brief Restores original values in LLM output using a session mapping
 *
 * Single pass: tokens found by FuzzyRehydrator are looked up through the
 * mapping's reverse table and replaced; lookups never consume entries.
 *
 * Unresolved reporting: a canonical token that is not in the mapping is
 * always reported. A variant token is reported only when its type exists
 * in the mapping, so bracketed prose such as "[Step 1]" is left alone.
 * With no mapping at all every token the grammar accepts is reported.
 */
class Deanonymizer {
public:
    struct Config {
        bool fuzzy_matching = true;
    };

    Deanonymizer() : Deanonymizer(Config{}) {}
    explicit Deanonymizer(const Config& config);

    [[nodiscard]] DeanonymizationResult deanonymize(std::string_view text,
                                                    const SessionMapping& mapping) const;

    /**
     * @brief Mapping-not-found path: text unchanged, every token unresolved
     */
    [[nodiscard]] DeanonymizationResult deanonymize_without_mapping(std::string_view text) const;

    [[nodiscard]] bool has_placeholders(std::string_view text) const;

    /**
     * @brief Canonical forms of every token in the text, first-seen order
     */
    [[nodiscard]] std::vector<std::string> extract_placeholders(std::string_view text) const;

    [[nodiscard]] const FuzzyRehydrator& rehydrator() const { return rehydrator_; }
    [[nodiscard]] const Config& config() const { return config_; }

private:
    [[nodiscard]] DeanonymizationResult run(std::string_view text,
                                            const SessionMapping* mapping) const;

    Config config_;
    FuzzyRehydrator rehydrator_;
};

} // namespace airlock
