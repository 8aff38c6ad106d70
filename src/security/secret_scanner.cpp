#include "security/secret_scanner.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <set>
#include <stdexcept>
#include <tuple>

namespace airlock {

namespace {

// Byte offsets at which each line begins
std::vector<size_t> line_starts(std::string_view text) {
    std::vector<size_t> starts{0};
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') starts.push_back(i + 1);
    }
    return starts;
}

size_t line_of(const std::vector<size_t>& starts, size_t pos) {
    const auto it = std::upper_bound(starts.begin(), starts.end(), pos);
    return static_cast<size_t>(it - starts.begin());
}

} // anonymous namespace

SecretScanner::SecretScanner(const Config& config)
    : config_(config) {
    if (config_.enable_predefined) {
        patterns_ = predefined_secret_patterns();
    }
}

SecretScanResult SecretScanner::scan(std::string_view text) const {
    utils::Timer timer;
    SecretScanResult result;
    result.text_length = text.size();

    if (text.empty()) {
        return result;
    }

    const auto starts = line_starts(text);
    std::set<std::tuple<size_t, size_t, std::string>> seen;

    std::shared_lock lock(mutex_);
    for (const auto& pattern : patterns_) {
        try {
            const std::cregex_iterator end;
            for (std::cregex_iterator it(text.data(), text.data() + text.size(), pattern.regex);
                 it != end; ++it) {
                const auto& m = *it;
                const auto start = static_cast<size_t>(m.position(0));
                const auto length = static_cast<size_t>(m.length(0));
                if (length == 0 || length > config_.max_match_length) continue;

                if (!seen.emplace(start, start + length, pattern.secret_type).second) continue;

                SecretMatch match;
                match.pattern_name = pattern.name;
                match.secret_type = pattern.secret_type;
                match.risk_level = pattern.risk_level;
                match.start = start;
                match.end = start + length;
                match.matched_text = m.str(0);
                match.line_number = line_of(starts, start);

                if (match.risk_level == RiskLevel::CRITICAL) result.has_critical = true;
                if (match.risk_level == RiskLevel::HIGH) result.has_high = true;
                result.matches.push_back(std::move(match));
            }
        } catch (const std::regex_error& e) {
            throw std::runtime_error(
                std::format("Secret pattern '{}' failed: {}", pattern.name, e.what()));
        }
    }
    lock.unlock();

    std::stable_sort(result.matches.begin(), result.matches.end(),
        [](const SecretMatch& a, const SecretMatch& b) { return a.start < b.start; });

    result.scan_time = timer.elapsed_us();
    return result;
}

void SecretScanner::add_pattern(SecretPattern pattern) {
    std::unique_lock lock(mutex_);
    patterns_.push_back(std::move(pattern));
}

size_t SecretScanner::remove_patterns_by_type(std::string_view secret_type) {
    std::unique_lock lock(mutex_);
    return std::erase_if(patterns_,
        [&](const SecretPattern& p) { return p.secret_type == secret_type; });
}

size_t SecretScanner::pattern_count() const {
    std::shared_lock lock(mutex_);
    return patterns_.size();
}

std::vector<std::string> SecretScanner::pattern_names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(patterns_.size());
    for (const auto& p : patterns_) {
        names.push_back(p.name);
    }
    return names;
}

} // namespace airlock
