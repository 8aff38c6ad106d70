#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace airlock {

struct IntentResult {
    bool is_question = false;
    double confidence = 0.0;
    std::string reason;
};

/**
 * @brief Tells questions about an entity apart from statements that use it
 *
 * "谁是张三？" asks about the person, so the name is kept for the model.
 * "给张三打电话" uses the person's data, so it is redacted. Only entity
 * types in question_favoring_types are ever kept; phone numbers, emails
 * and the like are redacted regardless of intent.
 *
 * Patterns are matched case-insensitively on UTF-8 bytes. Empty pattern
 * lists in Config select the built-in Chinese and English sets.
 */
class IntentDetector {
public:
    struct Config {
        size_t context_window = 50;     // code points on each side of the entity
        std::unordered_set<std::string> question_favoring_types = {
            "PERSON", "ORG", "ORGANIZATION", "LOCATION"};
        std::vector<std::string> question_patterns;
        std::vector<std::string> question_context_patterns;
        std::vector<std::string> statement_context_patterns;
    };

    IntentDetector() : IntentDetector(Config{}) {}

    /**
     * @throws std::regex_error if a custom pattern does not compile
     */
    explicit IntentDetector(Config config);

    /**
     * @brief Whole-text check: trailing '?' or a question pattern
     */
    [[nodiscard]] IntentResult is_question_text(std::string_view text) const;

    /**
     * @brief Is the entity at [start, end) being asked about?
     *
     * Order: whole text is a question, then question context around the
     * entity, then statement context. No signal defaults to statement.
     */
    [[nodiscard]] IntentResult is_question_context(std::string_view text,
                                                   size_t start, size_t end) const;

    /**
     * @brief True if an entity of this type at [start, end) stays in the text
     */
    [[nodiscard]] bool should_preserve(std::string_view text, const std::string& entity_type,
                                       size_t start, size_t end) const;

    [[nodiscard]] bool favors_questions(const std::string& entity_type) const {
        return config_.question_favoring_types.contains(entity_type);
    }

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
    std::vector<std::regex> question_;
    std::vector<std::regex> question_context_;
    std::vector<std::regex> statement_context_;
};

} // namespace airlock
