#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace airlock::placeholder {

// Wire format: <TYPE_N>, TYPE = [A-Z]+(_[A-Z]+)*, N = [1-9][0-9]*
inline constexpr size_t kMaxEntityTypeLength = 32;
inline constexpr size_t kMaxIndexDigits = 9;
inline constexpr uint32_t kMaxIndex = 999'999'999;

// Padding accepted on each side of the token body ("< PERSON_1 >")
inline constexpr size_t kMaxPadding = 2;

// Index separator with optional surrounding space ("PERSON _ 1")
inline constexpr size_t kMaxSeparatorWidth = 3;

// Longest token any grammar rule accepts: "{{" pad type sep index pad "}}"
inline constexpr size_t kMaxPlaceholderLength =
    2 + kMaxPadding + kMaxEntityTypeLength + kMaxSeparatorWidth + kMaxIndexDigits + kMaxPadding + 2;

/**
 * @brief Format the canonical token for (type, index)
 */
[[nodiscard]] std::string make(std::string_view entity_type, uint32_t index);

/**
 * @brief True if the name is usable as a placeholder type
 */
[[nodiscard]] bool is_valid_entity_type(std::string_view entity_type);

/**
 * @brief Uppercase, and map '-' and ' ' to '_' ("credit-card" -> "CREDIT_CARD")
 * @return Normalized name, or nullopt if it still is not a valid type
 */
[[nodiscard]] std::optional<std::string> normalize_entity_type(std::string_view raw);

/**
 * @brief Parse a canonical token; rejects every fuzzy variant
 */
[[nodiscard]] std::optional<std::pair<std::string, uint32_t>> parse_canonical(std::string_view token);

enum class ScanStatus : uint8_t {
    MATCH,      // complete token at pos
    PARTIAL,    // input ended while the token was still valid
    NO_MATCH
};

struct ScanResult {
    ScanStatus status = ScanStatus::NO_MATCH;
    FuzzyMatch match;   // valid only for MATCH
};

/**
 * @brief Try to read one placeholder-like token starting at text[pos]
 *
 * Accepts the canonical form plus bounded variants: mixed case type,
 * '-', ' ' or ':' separators, up to kMaxPadding spaces inside the
 * brackets, and [], {}, {{}} in place of <>. Never reads more than
 * kMaxPlaceholderLength bytes.
 */
[[nodiscard]] ScanResult scan_at(std::string_view text, size_t pos);

} // namespace airlock::placeholder
