#pragma once

#include "recognizer/entity_recognizer.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief EntityRecognitionPort backed by an explicit list of recognizers
 *
 * Wiring (add, add_port, remove) happens once at startup; detect() may
 * then be called concurrently.
 *
 * Any recognizer or external port failure fails the whole detection with
 * RecognitionError. Spans are returned unfiltered; thresholding and
 * overlap resolution belong to the Anonymizer.
 */
class RecognizerRegistry : public EntityRecognitionPort {
public:
    RecognizerRegistry() = default;

    /**
     * @brief Registry with every built-in recognizer
     */
    [[nodiscard]] static std::shared_ptr<RecognizerRegistry> with_builtins();

    void add(std::unique_ptr<EntityRecognizer> recognizer);

    /**
     * @brief Attach an external port (e.g. a NER service adapter for PERSON)
     */
    void add_port(std::shared_ptr<EntityRecognitionPort> port);

    bool remove(std::string_view name);

    [[nodiscard]] std::vector<std::string> recognizer_names() const;
    [[nodiscard]] size_t size() const { return recognizers_.size(); }

    [[nodiscard]] std::vector<DetectedSpan> detect(
        std::string_view text, std::string_view language) override;

private:
    std::vector<std::unique_ptr<EntityRecognizer>> recognizers_;
    std::vector<std::shared_ptr<EntityRecognitionPort>> ports_;
};

} // namespace airlock
