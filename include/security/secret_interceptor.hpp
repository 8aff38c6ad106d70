#pragma once

#include "core/types.hpp"
#include "security/secret_scanner.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief Pre-flight guard: refuses outbound text that carries credentials
 *
 * Runs before anonymization so secrets never reach the LLM provider,
 * placeholder or not. Matches at a risk level in block_on_risk block the
 * request; lower-risk matches are reported but allowed through.
 */
class SecretInterceptor {
public:
    struct Config {
        bool enabled = true;
        std::vector<RiskLevel> block_on_risk = {RiskLevel::CRITICAL, RiskLevel::HIGH};
    };

    struct InterceptResult {
        bool should_block = false;
        std::string reason;                         // empty unless blocked
        std::vector<SecretMatch> matches;           // every match
        std::vector<SecretMatch> blocked_matches;   // matches that triggered the block

        [[nodiscard]] bool safe_to_proceed() const { return !should_block; }
    };

    SecretInterceptor() : SecretInterceptor(std::make_shared<SecretScanner>(), Config{}) {}
    SecretInterceptor(std::shared_ptr<SecretScanner> scanner, Config config);

    [[nodiscard]] InterceptResult check(std::string_view content) const;

    /**
     * @brief Check every message content of a chat transcript
     *
     * Matches carry the index of their message, with offsets into its content.
     * Counts as one scan.
     */
    [[nodiscard]] InterceptResult check_messages(const std::vector<ChatMessage>& messages) const;

    /**
     * @brief Replace every match with "[REDACTED:<pattern name>]"
     *
     * Overlapping matches are merged: the earliest start wins, the longer
     * match on a tie.
     */
    [[nodiscard]] std::string sanitize(std::string_view content) const;

    [[nodiscard]] static std::string format_block_reason(const std::vector<SecretMatch>& matches);

    [[nodiscard]] bool enabled() const { return config_.enabled; }
    [[nodiscard]] const SecretScanner& scanner() const { return *scanner_; }

    struct Stats {
        uint64_t total_scans;
        uint64_t total_blocks;
        uint64_t total_matches;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_scans = total_scans_.load(std::memory_order_relaxed),
            .total_blocks = total_blocks_.load(std::memory_order_relaxed),
            .total_matches = total_matches_.load(std::memory_order_relaxed),
        };
    }

    void reset_stats() {
        total_scans_.store(0, std::memory_order_relaxed);
        total_blocks_.store(0, std::memory_order_relaxed);
        total_matches_.store(0, std::memory_order_relaxed);
    }

private:
    [[nodiscard]] bool blocks(RiskLevel level) const;
    [[nodiscard]] InterceptResult evaluate(std::vector<SecretMatch> matches) const;
    void log_block(const std::vector<SecretMatch>& blocked) const;

    std::shared_ptr<SecretScanner> scanner_;
    Config config_;

    mutable std::atomic<uint64_t> total_scans_{0};
    mutable std::atomic<uint64_t> total_blocks_{0};
    mutable std::atomic<uint64_t> total_matches_{0};
};

} // namespace airlock
