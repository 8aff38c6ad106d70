#include "core/anonymizer.hpp"
#include "core/error.hpp"
#include "core/masking.hpp"
#include "core/placeholder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace airlock {

namespace {

inline bool is_utf8_boundary(std::string_view text, size_t pos) {
    return pos == text.size() || (static_cast<unsigned char>(text[pos]) & 0xC0) != 0x80;
}

} // anonymous namespace

Anonymizer::Anonymizer(std::shared_ptr<EntityRecognitionPort> recognizer,
                       std::shared_ptr<const AllowlistRegistry> allowlist,
                       Config config)
    : recognizer_(std::move(recognizer)),
      allowlist_(std::move(allowlist)),
      config_(std::move(config)),
      intent_(config_.intent) {
    if (!recognizer_) {
        throw std::invalid_argument("Anonymizer requires an entity recognition port");
    }
}

AnonymizationStrategy Anonymizer::strategy_for(const std::string& entity_type) const {
    const auto it = config_.strategies.find(entity_type);
    return it != config_.strategies.end() ? it->second : AnonymizationStrategy::PLACEHOLDER;
}

std::vector<DetectedSpan> Anonymizer::resolve_overlaps(std::vector<DetectedSpan> spans) {
    std::stable_sort(spans.begin(), spans.end(),
        [](const DetectedSpan& a, const DetectedSpan& b) {
            if (a.score != b.score) return a.score > b.score;
            if (a.length() != b.length()) return a.length() > b.length();
            return a.start < b.start;
        });

    std::vector<DetectedSpan> kept;
    kept.reserve(spans.size());
    for (auto& span : spans) {
        const bool clashes = std::any_of(kept.begin(), kept.end(),
            [&](const DetectedSpan& k) { return k.overlaps(span); });
        if (!clashes) {
            kept.push_back(std::move(span));
        }
    }

    std::sort(kept.begin(), kept.end(),
        [](const DetectedSpan& a, const DetectedSpan& b) { return a.start < b.start; });
    return kept;
}

std::vector<DetectedSpan> Anonymizer::recognize(std::string_view text,
                                                std::string_view language) const {
    std::vector<DetectedSpan> raw;
    try {
        raw = recognizer_->detect(text, language);
    } catch (const RecognitionError& e) {
        recognition_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Entity recognition failed: {}", e.what()));
        throw;
    } catch (const std::exception& e) {
        recognition_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("Entity recognition failed: {}", e.what()));
        throw RecognitionError(std::format("Entity recognition failed: {}", e.what()));
    }

    const auto reject = [&](std::string message) -> RecognitionError {
        recognition_failures_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(message);
        return RecognitionError(std::move(message));
    };

    std::vector<DetectedSpan> spans;
    spans.reserve(raw.size());
    for (auto& span : raw) {
        if (span.start >= span.end || span.end > text.size()
            || !is_utf8_boundary(text, span.start) || !is_utf8_boundary(text, span.end)) {
            throw reject(std::format("Recognizer returned invalid span [{}, {}) for {}-byte text",
                                     span.start, span.end, text.size()));
        }
        if (span.score < config_.score_threshold) continue;

        auto type = placeholder::normalize_entity_type(span.entity_type);
        if (!type) {
            throw reject(std::format("Recognizer returned unusable entity type '{}'",
                                     span.entity_type));
        }
        if (const auto alias = config_.type_aliases.find(*type); alias != config_.type_aliases.end()) {
            *type = alias->second;
        }

        span.entity_type = std::move(*type);
        span.text = std::string(text.substr(span.start, span.end - span.start));
        spans.push_back(std::move(span));
    }
    return spans;
}

AnonymizationResult Anonymizer::anonymize(std::string_view text,
                                          SessionMapping& mapping) const {
    return anonymize(text, config_.language, mapping);
}

AnonymizationResult Anonymizer::anonymize(std::string_view text,
                                          std::string_view language,
                                          SessionMapping& mapping) const {
    total_calls_.fetch_add(1, std::memory_order_relaxed);

    AnonymizationResult result;
    if (utils::is_blank(text)) {
        result.text = std::string(text);
        return result;
    }

    auto spans = resolve_overlaps(recognize(text, language));

    std::vector<DetectedSpan> kept;
    kept.reserve(spans.size());
    for (auto& span : spans) {
        if (config_.intent_detection_enabled && intent_.favors_questions(span.entity_type)) {
            auto intent = intent_.is_question_context(text, span.start, span.end);
            if (intent.is_question) {
                result.intent_exemptions.push_back(
                    {span.entity_type, span.start, span.end, std::move(intent.reason)});
                continue;
            }
        }
        if (config_.allowlist_enabled && allowlist_
            && allowlist_->is_exempt(span.entity_type, span.text)) {
            result.exemptions.push_back({span.entity_type, span.start, span.end});
            continue;
        }
        kept.push_back(std::move(span));
    }

    if (!result.intent_exemptions.empty()) {
        total_intent_exemptions_.fetch_add(result.intent_exemptions.size(), std::memory_order_relaxed);
        for (const auto& ex : result.intent_exemptions) {
            utils::log::info(std::format("Kept {} at [{}, {}) in question context ({})",
                                         ex.entity_type, ex.start, ex.end, ex.reason));
        }
    }

    if (!result.exemptions.empty()) {
        total_exemptions_.fetch_add(result.exemptions.size(), std::memory_order_relaxed);
        std::string types;
        for (const auto& ex : result.exemptions) {
            if (!types.empty()) types += ", ";
            types += ex.entity_type;
        }
        utils::log::info(std::format("Allowlist exempted {} span(s): {}",
                                     result.exemptions.size(), types));
    }

    // CALL scope: dedup only against tokens allocated by this call
    std::unordered_map<std::string, std::string> call_tokens;

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;

    for (const auto& span : kept) {
        out.append(text.substr(cursor, span.start - cursor));
        cursor = span.end;

        const auto strategy = strategy_for(span.entity_type);
        if (strategy != AnonymizationStrategy::PLACEHOLDER) {
            out += MaskingEngine::apply(span.text, span.entity_type, strategy);
        } else if (config_.dedup_scope == DedupScope::SESSION) {
            out += mapping.get_or_allocate(span.entity_type, span.text);
        } else {
            const std::string key = span.entity_type + '\n' + span.text;
            auto it = call_tokens.find(key);
            if (it == call_tokens.end()) {
                it = call_tokens.emplace(key, mapping.allocate(span.entity_type, span.text)).first;
            }
            out += it->second;
        }
        ++result.counts[span.entity_type];
    }
    out.append(text.substr(cursor));

    total_entities_.fetch_add(kept.size(), std::memory_order_relaxed);
    result.text = std::move(out);
    result.entities = std::move(kept);
    return result;
}

} // namespace airlock
