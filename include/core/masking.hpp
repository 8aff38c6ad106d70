#pragma once

#include "core/types.hpp"
#include <string>
#include <string_view>

namespace airlock {

/**
 * @brief One-way replacement strategies for detected spans
 *
 * Strategies:
 * - MASK:    Format-aware partial mask ("13800138000" -> "138****8000")
 * - REDACT:  Replace entire value with "[REDACTED]"
 * - HASH:    SHA256 hex of "TYPE:value" (deterministic pseudonym)
 *
 * PLACEHOLDER is reversible and handled by the Anonymizer through the
 * session mapping, not here.
 */
class MaskingEngine {
public:
    static constexpr std::string_view kRedacted = "[REDACTED]";

    /**
     * @brief Apply a one-way strategy to a value
     * @throws std::invalid_argument for PLACEHOLDER
     */
    [[nodiscard]] static std::string apply(
        std::string_view value,
        std::string_view entity_type,
        AnonymizationStrategy strategy);

    /**
     * @brief Partial mask chosen by entity type (phone, email, id card, card, generic)
     */
    [[nodiscard]] static std::string mask_value(std::string_view value, std::string_view entity_type);

    [[nodiscard]] static std::string hash_value(std::string_view value, std::string_view entity_type);

private:
    static std::string mask_phone(std::string_view value);
    static std::string mask_email(std::string_view value);
    static std::string mask_digits(std::string_view value, size_t keep_prefix, size_t keep_suffix,
                                   bool allow_x);
    static std::string mask_generic(std::string_view value);
};

} // namespace airlock
