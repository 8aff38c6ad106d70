#include "recognizer/pattern_recognizer.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace airlock {

namespace {

std::string digits_only(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (const char c : s) {
        if (utils::is_ascii_digit(c)) out += c;
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// PatternRecognizer
// ============================================================================

PatternRecognizer::PatternRecognizer(std::string name,
                                     std::string entity_type,
                                     const std::vector<Pattern>& patterns,
                                     std::vector<std::string> context_words,
                                     std::vector<std::string> languages)
    : name_(std::move(name)),
      entity_type_(std::move(entity_type)),
      languages_(std::move(languages)) {
    patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        patterns_.push_back({p.name, std::regex(p.regex, std::regex::ECMAScript), p.score});
    }
    context_words_.reserve(context_words.size());
    for (const auto& w : context_words) {
        if (!w.empty()) context_words_.push_back(utils::to_lower(w));
    }
}

bool PatternRecognizer::supports_language(std::string_view language) const {
    if (languages_.empty()) return true;
    return std::find(languages_.begin(), languages_.end(), language) != languages_.end();
}

std::vector<DetectedSpan> PatternRecognizer::analyze(std::string_view text) const {
    std::vector<DetectedSpan> spans;
    const char* const begin = text.data();
    const char* const end = text.data() + text.size();

    for (const auto& pattern : patterns_) {
        for (std::cregex_iterator it(begin, end, pattern.regex), last; it != last; ++it) {
            const auto& m = *it;
            if (m.length(0) == 0) continue;

            const auto start = static_cast<size_t>(m.position(0));
            const auto stop = start + static_cast<size_t>(m.length(0));

            auto score = validate(text, start, stop, pattern.score);
            if (!score) continue;
            if (has_context(text, start)) {
                score = std::min(1.0, *score + kContextBoost);
            }
            spans.emplace_back(entity_type_, start, stop, *score,
                               std::string(text.substr(start, stop - start)));
        }
    }
    return spans;
}

std::optional<double> PatternRecognizer::validate(
    std::string_view /*text*/, size_t /*start*/, size_t /*end*/, double score) const {
    return score;
}

bool PatternRecognizer::digit_bounded(std::string_view text, size_t start, size_t end) {
    if (start > 0 && utils::is_ascii_digit(text[start - 1])) return false;
    if (end < text.size() && utils::is_ascii_digit(text[end])) return false;
    return true;
}

bool PatternRecognizer::has_context(std::string_view text, size_t start) const {
    if (context_words_.empty() || start == 0) return false;
    const size_t from = start > kContextWindow ? start - kContextWindow : 0;
    const std::string window = utils::to_lower(text.substr(from, start - from));
    return std::any_of(context_words_.begin(), context_words_.end(),
        [&](const std::string& w) { return window.find(w) != std::string::npos; });
}

// ============================================================================
// ChinesePhoneRecognizer
// ============================================================================

ChinesePhoneRecognizer::ChinesePhoneRecognizer()
    : PatternRecognizer(
        "zh_phone", "PHONE",
        {
            {"zh_mobile_intl", R"(\+?86[- ]?1[3-9]\d{9})", 0.85},
            {"zh_mobile", R"(1[3-9]\d{9})", 0.7},
            {"zh_mobile_grouped", R"(1[3-9]\d[- ]\d{4}[- ]\d{4})", 0.65},
        },
        {"电话", "手机", "联系方式", "号码", "phone", "mobile", "tel"},
        {"zh"}) {}

std::optional<double> ChinesePhoneRecognizer::validate(
    std::string_view text, size_t start, size_t end, double score) const {
    if (!digit_bounded(text, start, end)) return std::nullopt;
    return score;
}

// ============================================================================
// ChineseIdCardRecognizer
// ============================================================================

ChineseIdCardRecognizer::ChineseIdCardRecognizer()
    : PatternRecognizer(
        "zh_id_card", "ID_CARD",
        {
            {"zh_id_card_18",
             R"([1-9]\d{5}(?:18|19|20)\d{2}(?:0[1-9]|1[0-2])(?:0[1-9]|[12]\d|3[01])\d{3}[\dXx])",
             0.9},
        },
        {"身份证", "证件号", "公民身份号码", "id card", "identity"},
        {"zh"}) {}

bool ChineseIdCardRecognizer::checksum_valid(std::string_view id) {
    static constexpr int kWeights[17] = {7, 9, 10, 5, 8, 4, 2, 1, 6, 3, 7, 9, 10, 5, 8, 4, 2};
    static constexpr std::string_view kCheckMap = "10X98765432";

    if (id.size() != 18) return false;
    int sum = 0;
    for (size_t i = 0; i < 17; ++i) {
        if (!utils::is_ascii_digit(id[i])) return false;
        sum += (id[i] - '0') * kWeights[i];
    }
    char last = id[17];
    if (last == 'x') last = 'X';
    return kCheckMap[static_cast<size_t>(sum % 11)] == last;
}

std::optional<double> ChineseIdCardRecognizer::validate(
    std::string_view text, size_t start, size_t end, double score) const {
    if (!digit_bounded(text, start, end)) return std::nullopt;
    if (end < text.size() && (text[end] == 'X' || text[end] == 'x')) return std::nullopt;
    if (!checksum_valid(text.substr(start, end - start))) return std::nullopt;
    return score;
}

// ============================================================================
// EmailRecognizer
// ============================================================================

EmailRecognizer::EmailRecognizer()
    : PatternRecognizer(
        "email", "EMAIL",
        {
            {"email",
             R"([a-zA-Z0-9](?:[a-zA-Z0-9._%+-]*[a-zA-Z0-9])?@[a-zA-Z0-9](?:[a-zA-Z0-9.-]*[a-zA-Z0-9])?\.[a-zA-Z]{2,24})",
             0.9},
        },
        {"邮箱", "email", "mail"}) {}

// ============================================================================
// CreditCardRecognizer
// ============================================================================

CreditCardRecognizer::CreditCardRecognizer()
    : PatternRecognizer(
        "credit_card", "CREDIT_CARD",
        {
            {"card_contiguous", R"(\d{13,19})", 0.85},
            {"card_grouped", R"(\d{4}[ -]\d{4}[ -]\d{4}[ -]\d{1,7})", 0.85},
            {"card_amex", R"(\d{4}[ -]\d{6}[ -]\d{5})", 0.85},
        },
        {"银行卡", "信用卡", "卡号", "card"}) {}

bool CreditCardRecognizer::luhn_valid(std::string_view number) {
    const std::string digits = digits_only(number);
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }

    int sum = 0;
    bool double_digit = false;

    // Process from right to left
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        int digit = *it - '0';
        if (double_digit) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        double_digit = !double_digit;
    }

    return (sum % 10) == 0;
}

std::optional<double> CreditCardRecognizer::validate(
    std::string_view text, size_t start, size_t end, double score) const {
    if (!digit_bounded(text, start, end)) return std::nullopt;
    if (!luhn_valid(text.substr(start, end - start))) return std::nullopt;
    return score;
}

// ============================================================================
// IpAddressRecognizer
// ============================================================================

IpAddressRecognizer::IpAddressRecognizer()
    : PatternRecognizer(
        "ipv4", "IP",
        {
            {"ipv4", R"((?:\d{1,3}\.){3}\d{1,3})", 0.6},
        },
        {"ip", "地址", "address", "host"}) {}

std::optional<double> IpAddressRecognizer::validate(
    std::string_view text, size_t start, size_t end, double score) const {
    if (start > 0 && (utils::is_ascii_digit(text[start - 1]) || text[start - 1] == '.')) {
        return std::nullopt;
    }
    if (end < text.size()) {
        if (utils::is_ascii_digit(text[end])) return std::nullopt;
        if (text[end] == '.' && end + 1 < text.size() && utils::is_ascii_digit(text[end + 1])) {
            return std::nullopt;
        }
    }

    for (const auto& octet : utils::split(std::string(text.substr(start, end - start)), '.')) {
        if (octet.size() > 1 && octet[0] == '0') return std::nullopt;
        if (utils::parse_int<int>(octet, 256) > 255) return std::nullopt;
    }
    return score;
}

} // namespace airlock
