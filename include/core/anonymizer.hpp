#pragma once

#include "core/intent_detector.hpp"
#include "core/session_mapping.hpp"
#include "core/types.hpp"
#include "recognizer/allowlist_registry.hpp"
#include "recognizer/entity_recognizer.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace airlock {

struct AllowlistExemption {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
};

struct IntentExemption {
    std::string entity_type;
    size_t start = 0;
    size_t end = 0;
    std::string reason;
};

struct AnonymizationResult {
    std::string text;
    std::map<std::string, size_t> counts;       // entity type -> spans replaced
    std::vector<DetectedSpan> entities;         // retained spans, left to right
    std::vector<AllowlistExemption> exemptions;
    std::vector<IntentExemption> intent_exemptions;
};

/**
 * @brief Replaces detected PII with placeholders (or one-way strategies)
 *
 * Steps per call:
 * 1. detect spans through the recognition port (failure aborts the call)
 * 2. drop spans below score_threshold, normalize their type names
 * 3. resolve overlaps: higher score wins, then the longer span
 * 4. keep question-context entities ("谁是张三？"), then allowlisted
 *    (type, text) pairs, in the text
 * 5. left to right: reuse or allocate placeholders in the mapping
 * 6. build the output in one pass
 *
 * The mapping is only touched in step 5, after recognition succeeded.
 */
class Anonymizer {
public:
    struct Config {
        std::string language = "zh";
        double score_threshold = 0.5;
        DedupScope dedup_scope = DedupScope::SESSION;
        bool allowlist_enabled = true;
        bool intent_detection_enabled = true;
        IntentDetector::Config intent;

        // entity type -> strategy; types not listed use PLACEHOLDER
        std::unordered_map<std::string, AnonymizationStrategy> strategies;

        // recognizer type name -> placeholder type name
        std::unordered_map<std::string, std::string> type_aliases = {
            {"PHONE_NUMBER", "PHONE"},
            {"EMAIL_ADDRESS", "EMAIL"},
            {"ZH_ID_CARD", "ID_CARD"},
            {"ZH_PHONE", "PHONE"},
            {"IP_ADDRESS", "IP"},
        };
    };

    Anonymizer(std::shared_ptr<EntityRecognitionPort> recognizer,
               std::shared_ptr<const AllowlistRegistry> allowlist,
               Config config);

    /**
     * @throws RecognitionError if recognition fails or returns malformed spans
     */
    [[nodiscard]] AnonymizationResult anonymize(std::string_view text,
                                                SessionMapping& mapping) const;

    [[nodiscard]] AnonymizationResult anonymize(std::string_view text,
                                                std::string_view language,
                                                SessionMapping& mapping) const;

    /**
     * @brief Non-overlapping subset, sorted by start
     *
     * Priority: higher score, then longer span, then earlier start.
     */
    [[nodiscard]] static std::vector<DetectedSpan> resolve_overlaps(std::vector<DetectedSpan> spans);

    [[nodiscard]] AnonymizationStrategy strategy_for(const std::string& entity_type) const;
    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t total_calls;
        uint64_t total_entities;
        uint64_t total_exemptions;
        uint64_t total_intent_exemptions;
        uint64_t recognition_failures;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_calls = total_calls_.load(std::memory_order_relaxed),
            .total_entities = total_entities_.load(std::memory_order_relaxed),
            .total_exemptions = total_exemptions_.load(std::memory_order_relaxed),
            .total_intent_exemptions = total_intent_exemptions_.load(std::memory_order_relaxed),
            .recognition_failures = recognition_failures_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] std::vector<DetectedSpan> recognize(std::string_view text,
                                                      std::string_view language) const;

    std::shared_ptr<EntityRecognitionPort> recognizer_;
    std::shared_ptr<const AllowlistRegistry> allowlist_;
    Config config_;
    IntentDetector intent_;

    mutable std::atomic<uint64_t> total_calls_{0};
    mutable std::atomic<uint64_t> total_entities_{0};
    mutable std::atomic<uint64_t> total_exemptions_{0};
    mutable std::atomic<uint64_t> total_intent_exemptions_{0};
    mutable std::atomic<uint64_t> recognition_failures_{0};
};

} // namespace airlock
