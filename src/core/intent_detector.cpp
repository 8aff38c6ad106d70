#include "core/intent_detector.hpp"
#include "core/utils.hpp"

#include <format>

namespace airlock {

namespace {

const std::vector<std::string> kQuestionPatterns = {
    R"(^\s*(\?|？|谁|何人|哪位|哪些|什么叫|什么是|请问|如何|怎么|多少|几|是不是|能否|可以))",
    R"((是誰|是谁|是什么|怎么样|如何|吗\?|呢\?|吗？|呢？)$)",
    R"(^\s*(请| kindly)?(告诉我|介绍一下|讲讲|说说|描述一下|解释一下))",
    R"((你知道|听说过))",
    R"((查一下|查查|搜索|找一下|找找))",
    R"(^\s*(who|what|where|when|why|how|which|whose|whom|is|are|do|does|can|could|would|should|will)\b)",
    R"((tell me|describe|explain|introduce))",
    R"((do you know|have you heard))",
};

const std::vector<std::string> kQuestionContextPatterns = {
    R"((是哪|是誰|是谁|叫什么|叫啥|what is|who is))",
    R"((介绍|描述|explain|describe|introduce|tell me about))",
};

const std::vector<std::string> kStatementContextPatterns = {
    R"((联系|呼叫|发邮件|发送|写信|给|告诉|通知|提醒|call|email|text|send|write|notify))",
    R"((的电话|的邮箱|的地址|的身份证|的手机|'s phone|'s email|'s address))",
};

std::vector<std::regex> compile(const std::vector<std::string>& custom,
                                const std::vector<std::string>& defaults) {
    const auto& source = custom.empty() ? defaults : custom;
    std::vector<std::regex> out;
    out.reserve(source.size());
    for (const auto& pattern : source) {
        out.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    }
    return out;
}

bool any_match(const std::vector<std::regex>& patterns, std::string_view text, size_t* which) {
    for (size_t i = 0; i < patterns.size(); ++i) {
        if (std::regex_search(text.begin(), text.end(), patterns[i])) {
            *which = i;
            return true;
        }
    }
    return false;
}

inline bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Step back n code points from pos
size_t back_code_points(std::string_view text, size_t pos, size_t n) {
    while (n > 0 && pos > 0) {
        --pos;
        while (pos > 0 && is_continuation(text[pos])) --pos;
        --n;
    }
    return pos;
}

// Step forward n code points from pos
size_t forward_code_points(std::string_view text, size_t pos, size_t n) {
    while (n > 0 && pos < text.size()) {
        ++pos;
        while (pos < text.size() && is_continuation(text[pos])) ++pos;
        --n;
    }
    return pos;
}

} // anonymous namespace

IntentDetector::IntentDetector(Config config)
    : config_(std::move(config)),
      question_(compile(config_.question_patterns, kQuestionPatterns)),
      question_context_(compile(config_.question_context_patterns, kQuestionContextPatterns)),
      statement_context_(compile(config_.statement_context_patterns, kStatementContextPatterns)) {}

IntentResult IntentDetector::is_question_text(std::string_view text) const {
    const std::string trimmed = utils::trim(std::string(text));
    if (trimmed.empty()) {
        return {false, 0.0, "empty text"};
    }

    if (trimmed.ends_with("?") || trimmed.ends_with("？")) {
        return {true, 0.9, "ends with question mark"};
    }

    size_t which = 0;
    if (any_match(question_, trimmed, &which)) {
        return {true, 0.85, std::format("question pattern {}", which)};
    }
    return {false, 0.7, "no question pattern"};
}

IntentResult IntentDetector::is_question_context(std::string_view text,
                                                 size_t start, size_t end) const {
    if (text.empty() || start >= end || end > text.size()) {
        return {false, 0.0, "invalid position"};
    }

    if (const auto whole = is_question_text(text); whole.is_question && whole.confidence > 0.8) {
        return {true, 0.95, "whole text is a question"};
    }

    const size_t from = back_code_points(text, start, config_.context_window);
    const size_t to = forward_code_points(text, end, config_.context_window);
    const auto context = text.substr(from, to - from);

    size_t which = 0;
    if (any_match(question_context_, context, &which)) {
        return {true, 0.85, std::format("question context pattern {}", which)};
    }
    if (any_match(statement_context_, context, &which)) {
        return {false, 0.9, std::format("statement context pattern {}", which)};
    }
    return {false, 0.5, "no context, treated as statement"};
}

bool IntentDetector::should_preserve(std::string_view text, const std::string& entity_type,
                                     size_t start, size_t end) const {
    if (!favors_questions(entity_type)) return false;
    return is_question_context(text, start, end).is_question;
}

} // namespace airlock
