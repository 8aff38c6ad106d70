#pragma once

#include "core/types.hpp"

#include <regex>
#include <string>
#include <vector>

namespace airlock {

/**
 * @brief Source form of a secret pattern (as written in config)
 *
 * Regexes use ECMAScript syntax (std::regex); no lookbehind.
 */
struct SecretPatternDef {
    std::string name;           // "OpenAI API Key"
    std::string secret_type;    // "openai_api_key"
    std::string regex;
    RiskLevel risk_level = RiskLevel::HIGH;
    std::string description;
    bool case_insensitive = false;
};

struct SecretPattern {
    std::string name;
    std::string secret_type;
    std::regex regex;
    RiskLevel risk_level = RiskLevel::HIGH;
    std::string description;
};

/**
 * @throws std::invalid_argument if the regex does not compile
 */
[[nodiscard]] SecretPattern compile_secret_pattern(const SecretPatternDef& def);

/**
 * @brief Built-in credential patterns: cloud keys, VCS tokens, chat bot
 * tokens, JWTs, connection strings and PEM private key headers
 */
[[nodiscard]] const std::vector<SecretPatternDef>& predefined_secret_pattern_defs();

[[nodiscard]] std::vector<SecretPattern> predefined_secret_patterns();

} // namespace airlock
