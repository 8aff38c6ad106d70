#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief Source of typed spans consumed by the Anonymizer
 *
 * Implemented by RecognizerRegistry and by adapters around an external
 * NER model. Failure is reported by throwing RecognitionError; callers
 * treat it as terminal for the request.
 */
class EntityRecognitionPort {
public:
    virtual ~EntityRecognitionPort() = default;

    [[nodiscard]] virtual std::vector<DetectedSpan> detect(
        std::string_view text, std::string_view language) = 0;
};

/**
 * @brief One detector for one entity type
 *
 * Implementations are immutable after construction and safe to call
 * concurrently.
 */
class EntityRecognizer {
public:
    virtual ~EntityRecognizer() = default;

    [[nodiscard]] virtual const std::string& name() const = 0;
    [[nodiscard]] virtual const std::string& entity_type() const = 0;
    [[nodiscard]] virtual bool supports_language(std::string_view language) const = 0;
    [[nodiscard]] virtual std::vector<DetectedSpan> analyze(std::string_view text) const = 0;
};

} // namespace airlock
