#include "security/secret_interceptor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace airlock {

SecretInterceptor::SecretInterceptor(std::shared_ptr<SecretScanner> scanner, Config config)
    : scanner_(std::move(scanner)),
      config_(std::move(config)) {
    if (!scanner_) {
        throw std::invalid_argument("SecretInterceptor requires a scanner");
    }
}

bool SecretInterceptor::blocks(RiskLevel level) const {
    return std::find(config_.block_on_risk.begin(), config_.block_on_risk.end(), level)
        != config_.block_on_risk.end();
}

SecretInterceptor::InterceptResult SecretInterceptor::check(std::string_view content) const {
    if (!config_.enabled) {
        return {};
    }
    total_scans_.fetch_add(1, std::memory_order_relaxed);
    return evaluate(scanner_->scan(content).matches);
}

SecretInterceptor::InterceptResult SecretInterceptor::check_messages(
    const std::vector<ChatMessage>& messages) const {
    if (!config_.enabled) {
        return {};
    }
    total_scans_.fetch_add(1, std::memory_order_relaxed);

    std::vector<SecretMatch> matches;
    for (size_t i = 0; i < messages.size(); ++i) {
        for (auto& match : scanner_->scan(messages[i].content).matches) {
            match.message_index = i;
            matches.push_back(std::move(match));
        }
    }
    return evaluate(std::move(matches));
}

SecretInterceptor::InterceptResult SecretInterceptor::evaluate(std::vector<SecretMatch> matches) const {
    InterceptResult result;
    total_matches_.fetch_add(matches.size(), std::memory_order_relaxed);

    for (const auto& match : matches) {
        if (blocks(match.risk_level)) {
            result.blocked_matches.push_back(match);
        }
    }
    result.matches = std::move(matches);

    if (!result.blocked_matches.empty()) {
        result.should_block = true;
        result.reason = format_block_reason(result.blocked_matches);
        total_blocks_.fetch_add(1, std::memory_order_relaxed);
        log_block(result.blocked_matches);
    }
    return result;
}

std::string SecretInterceptor::sanitize(std::string_view content) const {
    auto matches = scanner_->scan(content).matches;
    if (matches.empty()) {
        return std::string(content);
    }

    std::sort(matches.begin(), matches.end(),
        [](const SecretMatch& a, const SecretMatch& b) {
            if (a.start != b.start) return a.start < b.start;
            return a.end > b.end;
        });

    std::vector<const SecretMatch*> kept;
    size_t covered_to = 0;
    for (const auto& m : matches) {
        if (!kept.empty() && m.start < covered_to) continue;
        kept.push_back(&m);
        covered_to = m.end;
    }

    std::string out(content);
    for (auto it = kept.rbegin(); it != kept.rend(); ++it) {
        const auto* m = *it;
        out.replace(m->start, m->end - m->start, std::format("[REDACTED:{}]", m->pattern_name));
    }
    return out;
}

std::string SecretInterceptor::format_block_reason(const std::vector<SecretMatch>& matches) {
    // secret type -> count, in first-seen order
    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& m : matches) {
        auto it = std::find_if(counts.begin(), counts.end(),
            [&](const auto& entry) { return entry.first == m.secret_type; });
        if (it == counts.end()) {
            counts.emplace_back(m.secret_type, 1);
        } else {
            ++it->second;
        }
    }

    std::string reason = "Sensitive secrets detected: ";
    for (size_t i = 0; i < counts.size(); ++i) {
        if (i > 0) reason += ", ";
        reason += std::format("{} {}", counts[i].second, counts[i].first);
    }
    return reason;
}

void SecretInterceptor::log_block(const std::vector<SecretMatch>& blocked) const {
    // never log matched text
    std::string detail;
    for (const auto& m : blocked) {
        detail += std::format("\n  - {} ({}) at {}-{}",
                              m.pattern_name, risk_level_to_string(m.risk_level), m.start, m.end);
        if (m.message_index) {
            detail += std::format(" in message {}", *m.message_index);
        }
    }
    utils::log::warn(std::format("Secret interceptor blocked request: {} secret(s){}",
                                 blocked.size(), detail));
}

} // namespace airlock
