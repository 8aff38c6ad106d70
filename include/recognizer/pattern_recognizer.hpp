#pragma once

#include "recognizer/entity_recognizer.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief Regex-driven recognizer with optional context-word boost
 *
 * Each match is passed through validate(), which may reject it or adjust
 * its score. If one of the context words occurs within kContextWindow
 * bytes before the match, the score is raised by kContextBoost (max 1.0).
 */
class PatternRecognizer : public EntityRecognizer {
public:
    struct Pattern {
        std::string name;
        std::string regex;
        double score = 0.5;
    };

    static constexpr size_t kContextWindow = 64;
    static constexpr double kContextBoost = 0.1;

    /**
     * @param languages Empty means every language
     * @throws std::regex_error on an invalid pattern
     */
    PatternRecognizer(std::string name,
                      std::string entity_type,
                      const std::vector<Pattern>& patterns,
                      std::vector<std::string> context_words = {},
                      std::vector<std::string> languages = {});

    [[nodiscard]] const std::string& name() const override { return name_; }
    [[nodiscard]] const std::string& entity_type() const override { return entity_type_; }
    [[nodiscard]] bool supports_language(std::string_view language) const override;
    [[nodiscard]] std::vector<DetectedSpan> analyze(std::string_view text) const override;

protected:
    /**
     * @brief Accept, reject (nullopt) or rescore a match at [start, end)
     */
    [[nodiscard]] virtual std::optional<double> validate(
        std::string_view text, size_t start, size_t end, double score) const;

    // True when the bytes on either side of [start, end) are not ASCII digits
    [[nodiscard]] static bool digit_bounded(std::string_view text, size_t start, size_t end);

private:
    struct CompiledPattern {
        std::string name;
        std::regex regex;
        double score;
    };

    [[nodiscard]] bool has_context(std::string_view text, size_t start) const;

    std::string name_;
    std::string entity_type_;
    std::vector<CompiledPattern> patterns_;
    std::vector<std::string> context_words_;    // lowercased
    std::vector<std::string> languages_;
};

// ============================================================================
// Built-in recognizers
// ============================================================================

/**
 * @brief Mainland China mobile numbers: 13800138000, +86 138..., 138-0013-8000
 */
class ChinesePhoneRecognizer : public PatternRecognizer {
public:
    ChinesePhoneRecognizer();

protected:
    [[nodiscard]] std::optional<double> validate(
        std::string_view text, size_t start, size_t end, double score) const override;
};

/**
 * @brief 18-digit resident ID; ISO 7064 MOD 11-2 checksum must hold
 */
class ChineseIdCardRecognizer : public PatternRecognizer {
public:
    ChineseIdCardRecognizer();

    [[nodiscard]] static bool checksum_valid(std::string_view id);

protected:
    [[nodiscard]] std::optional<double> validate(
        std::string_view text, size_t start, size_t end, double score) const override;
};

class EmailRecognizer : public PatternRecognizer {
public:
    EmailRecognizer();
};

/**
 * @brief 13-19 digit card numbers, contiguous or grouped; Luhn validated
 */
class CreditCardRecognizer : public PatternRecognizer {
public:
    CreditCardRecognizer();

    [[nodiscard]] static bool luhn_valid(std::string_view number);

protected:
    [[nodiscard]] std::optional<double> validate(
        std::string_view text, size_t start, size_t end, double score) const override;
};

/**
 * @brief Dotted-quad IPv4 with octet range check
 */
class IpAddressRecognizer : public PatternRecognizer {
public:
    IpAddressRecognizer();

protected:
    [[nodiscard]] std::optional<double> validate(
        std::string_view text, size_t start, size_t end, double score) const override;
};

} // namespace airlock
