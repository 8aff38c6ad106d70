#include "recognizer/recognizer_registry.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <format>
#include <iterator>

namespace airlock {

std::shared_ptr<RecognizerRegistry> RecognizerRegistry::with_builtins() {
    auto registry = std::make_shared<RecognizerRegistry>();
    registry->add(std::make_unique<ChinesePhoneRecognizer>());
    registry->add(std::make_unique<ChineseIdCardRecognizer>());
    registry->add(std::make_unique<EmailRecognizer>());
    registry->add(std::make_unique<CreditCardRecognizer>());
    registry->add(std::make_unique<IpAddressRecognizer>());
    return registry;
}

void RecognizerRegistry::add(std::unique_ptr<EntityRecognizer> recognizer) {
    if (recognizer) {
        recognizers_.push_back(std::move(recognizer));
    }
}

void RecognizerRegistry::add_port(std::shared_ptr<EntityRecognitionPort> port) {
    if (port) {
        ports_.push_back(std::move(port));
    }
}

bool RecognizerRegistry::remove(std::string_view name) {
    const auto before = recognizers_.size();
    std::erase_if(recognizers_, [&](const auto& r) { return r->name() == name; });
    return recognizers_.size() != before;
}

std::vector<std::string> RecognizerRegistry::recognizer_names() const {
    std::vector<std::string> names;
    names.reserve(recognizers_.size());
    for (const auto& r : recognizers_) {
        names.push_back(r->name());
    }
    return names;
}

std::vector<DetectedSpan> RecognizerRegistry::detect(
    std::string_view text, std::string_view language) {

    std::vector<DetectedSpan> spans;

    for (const auto& recognizer : recognizers_) {
        if (!recognizer->supports_language(language)) continue;
        try {
            auto found = recognizer->analyze(text);
            spans.insert(spans.end(),
                         std::make_move_iterator(found.begin()),
                         std::make_move_iterator(found.end()));
        } catch (const std::exception& e) {
            // std::regex can throw error_complexity / error_stack on hostile input
            throw RecognitionError(
                std::format("Recognizer '{}' failed: {}", recognizer->name(), e.what()));
        }
    }

    for (const auto& port : ports_) {
        try {
            auto found = port->detect(text, language);
            spans.insert(spans.end(),
                         std::make_move_iterator(found.begin()),
                         std::make_move_iterator(found.end()));
        } catch (const RecognitionError&) {
            throw;
        } catch (const std::exception& e) {
            throw RecognitionError(std::format("External recognizer failed: {}", e.what()));
        }
    }

    return spans;
}

} // namespace airlock
