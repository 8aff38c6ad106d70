#pragma once

#include "core/types.hpp"
#include "security/secret_patterns.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace airlock {

// ============================================================================
// Configuration Types (mirror the TOML sections)
// ============================================================================

struct AnonymizerSection {
    std::string language = "zh";
    double score_threshold = 0.5;
    DedupScope dedup_scope = DedupScope::SESSION;
    bool allowlist_enabled = true;
    std::string allowlist_dir;      // every *.txt registered as a list (empty = none)
    bool intent_detection_enabled = true;

    // types kept in the text when asked about ("谁是张三？")
    std::vector<std::string> question_favoring_types = {"PERSON", "ORG", "ORGANIZATION", "LOCATION"};

    // normalized entity type -> strategy
    std::unordered_map<std::string, AnonymizationStrategy> strategies;
};

struct DeanonymizerSection {
    bool fuzzy_matching = true;
};

struct StoreSection {
    std::string backend = "memory";     // memory | redis
    int64_t default_ttl_seconds = 300;
    int64_t cleanup_interval_seconds = 60;
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string key_prefix = "pii_airlock:mapping:";
};

struct SecretScannerSection {
    bool enabled = true;
    bool enable_predefined = true;
    std::vector<RiskLevel> block_on_risk = {RiskLevel::CRITICAL, RiskLevel::HIGH};
    int64_t max_match_length = 1000;
    std::vector<SecretPatternDef> patterns;     // custom, added after the predefined set
};

struct CustomPatternConfig {
    std::string name;
    std::string entity_type;        // normalized
    std::string regex;
    double score = 0.85;
    std::vector<std::string> context;
    std::vector<std::string> languages;     // empty = every language
};

struct AllowlistConfig {
    std::string name;
    std::string entity_type = "*";
    bool enabled = true;
    bool case_sensitive = false;
    std::vector<std::string> entries;
    std::string file;               // optional; resolved against the config file's directory
};

struct LoggingConfig {
    std::string level = "info";
};

struct AirlockConfig {
    AnonymizerSection anonymizer;
    DeanonymizerSection deanonymizer;
    StoreSection store;
    SecretScannerSection secret_scanner;
    std::vector<CustomPatternConfig> patterns;
    std::vector<AllowlistConfig> allowlists;
    LoggingConfig logging;
};

} // namespace airlock
