#pragma once

#include "core/types.hpp"
#include "security/secret_patterns.hpp"

#include <chrono>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

struct SecretScanResult {
    std::vector<SecretMatch> matches;   // sorted by start
    size_t text_length = 0;
    std::chrono::microseconds scan_time{0};
    bool has_critical = false;
    bool has_high = false;

    [[nodiscard]] bool has_secrets() const { return !matches.empty(); }
};

/**
 * @brief Regex scanner for credentials and tokens in outbound text
 *
 * Matches are deduplicated on (start, end, secret_type). Thread-safe:
 * scans take a shared lock, pattern edits an exclusive one.
 */
class SecretScanner {
public:
    struct Config {
        bool enable_predefined = true;
        size_t max_match_length = 1000;     // longer matches are ignored
    };

    SecretScanner() : SecretScanner(Config{}) {}
    explicit SecretScanner(const Config& config);

    /**
     * @throws std::runtime_error if a pattern exceeds regex engine limits
     */
    [[nodiscard]] SecretScanResult scan(std::string_view text) const;

    void add_pattern(SecretPattern pattern);

    /**
     * @return Number of patterns removed
     */
    size_t remove_patterns_by_type(std::string_view secret_type);

    [[nodiscard]] size_t pattern_count() const;
    [[nodiscard]] std::vector<std::string> pattern_names() const;

private:
    Config config_;
    mutable std::shared_mutex mutex_;
    std::vector<SecretPattern> patterns_;
};

} // namespace airlock
