#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace airlock {

// ============================================================================
// Detection
// ============================================================================

/**
 * @brief A typed span reported by entity recognition
 *
 * Offsets are byte offsets into the UTF-8 input: [start, end).
 */
struct DetectedSpan {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    double score = 0.0;
    std::string text;

    DetectedSpan() = default;
    DetectedSpan(std::string type, size_t s, size_t e, double sc, std::string t = {})
        : entity_type(std::move(type)), start(s), end(e), score(sc), text(std::move(t)) {}

    [[nodiscard]] size_t length() const { return end - start; }

    [[nodiscard]] bool overlaps(const DetectedSpan& other) const {
        return start < other.end && other.start < end;
    }
};

// ============================================================================
// Anonymization
// ============================================================================

/**
 * @brief How a detected span is replaced in outbound text
 *
 * Only PLACEHOLDER is reversible; the others are one-way.
 */
enum class AnonymizationStrategy : uint8_t {
    PLACEHOLDER,
    MASK,
    REDACT,
    HASH
};

/**
 * @brief Lifetime over which identical (type, original) pairs share a placeholder
 */
enum class DedupScope : uint8_t {
    SESSION,    // reuse across every call sharing the session mapping
    CALL        // reuse only within a single anonymize() call
};

[[nodiscard]] inline const char* strategy_to_string(AnonymizationStrategy s) {
    switch (s) {
        case AnonymizationStrategy::PLACEHOLDER: return "placeholder";
        case AnonymizationStrategy::MASK:        return "mask";
        case AnonymizationStrategy::REDACT:      return "redact";
        case AnonymizationStrategy::HASH:        return "hash";
    }
    return "placeholder";
}

[[nodiscard]] inline std::optional<AnonymizationStrategy> parse_strategy(std::string_view s) {
    if (s == "placeholder") return AnonymizationStrategy::PLACEHOLDER;
    if (s == "mask")        return AnonymizationStrategy::MASK;
    if (s == "redact")      return AnonymizationStrategy::REDACT;
    if (s == "hash")        return AnonymizationStrategy::HASH;
    return std::nullopt;
}

[[nodiscard]] inline std::optional<DedupScope> parse_dedup_scope(std::string_view s) {
    if (s == "session") return DedupScope::SESSION;
    if (s == "call")    return DedupScope::CALL;
    return std::nullopt;
}

// ============================================================================
// Rehydration
// ============================================================================

/**
 * @brief Which rule of the placeholder grammar a token matched
 */
enum class FuzzyMatchKind : uint8_t {
    EXACT,      // <TYPE_N>
    CASE,       // <Type_n>, <type_1>
    SEPARATOR,  // <TYPE-1>, <TYPE 1>, <TYPE:1>, padded whitespace
    BRACKET     // [TYPE_1], {TYPE_1}, {{TYPE_1}}
};

[[nodiscard]] inline const char* match_kind_to_string(FuzzyMatchKind k) {
    switch (k) {
        case FuzzyMatchKind::EXACT:     return "exact";
        case FuzzyMatchKind::CASE:      return "case";
        case FuzzyMatchKind::SEPARATOR: return "separator";
        case FuzzyMatchKind::BRACKET:   return "bracket";
    }
    return "exact";
}

/**
 * @brief A placeholder-like token found in LLM output
 */
struct FuzzyMatch {
    size_t start = 0;
    size_t end = 0;
    std::string raw_span;           // literal text as it appeared
    std::string normalized_form;    // canonical <TYPE_N>
    std::string resolved_type;
    uint32_t resolved_index = 0;
    FuzzyMatchKind match_kind = FuzzyMatchKind::EXACT;
};

// ============================================================================
// Secrets
// ============================================================================

enum class RiskLevel : uint8_t {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

[[nodiscard]] inline const char* risk_level_to_string(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:      return "low";
        case RiskLevel::MEDIUM:   return "medium";
        case RiskLevel::HIGH:     return "high";
        case RiskLevel::CRITICAL: return "critical";
    }
    return "low";
}

[[nodiscard]] inline std::optional<RiskLevel> parse_risk_level(std::string_view s) {
    if (s == "low")      return RiskLevel::LOW;
    if (s == "medium")   return RiskLevel::MEDIUM;
    if (s == "high")     return RiskLevel::HIGH;
    if (s == "critical") return RiskLevel::CRITICAL;
    return std::nullopt;
}

/**
 * @brief A credential or token found by the secret scanner
 */
struct SecretMatch {
    std::string pattern_name;   // "OpenAI API Key"
    std::string secret_type;    // "openai_api_key"
    RiskLevel risk_level = RiskLevel::LOW;
    size_t start = 0;
    size_t end = 0;
    std::string matched_text;
    size_t line_number = 0;     // 1-based

    // Set for chat transcripts; start, end and line_number are then
    // relative to that message's content
    std::optional<size_t> message_index;

    /**
     * @brief Display-safe preview: first and last 4 chars, or all stars when short
     */
    [[nodiscard]] std::string redacted() const {
        if (matched_text.size() <= 8) {
            return std::string(matched_text.size(), '*');
        }
        return matched_text.substr(0, 4) + "****" + matched_text.substr(matched_text.size() - 4);
    }
};

// ============================================================================
// Chat content
// ============================================================================

struct ChatMessage {
    std::string role;
    std::string content;
};

} // namespace airlock
