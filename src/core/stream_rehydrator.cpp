#include "core/stream_rehydrator.hpp"

#include <algorithm>

namespace airlock {

StreamRehydrator::StreamRehydrator(std::shared_ptr<const SessionMapping> mapping,
                                   const Deanonymizer& deanonymizer)
    : mapping_(std::move(mapping)), deanonymizer_(deanonymizer) {}

std::string StreamRehydrator::restore(std::string_view text) {
    if (text.empty()) return {};

    auto result = mapping_
        ? deanonymizer_.deanonymize(text, *mapping_)
        : deanonymizer_.deanonymize_without_mapping(text);

    replaced_count_ += result.replaced_count;
    for (auto& token : result.unresolved) {
        if (std::find(unresolved_.begin(), unresolved_.end(), token) == unresolved_.end()) {
            unresolved_.push_back(std::move(token));
        }
    }
    return std::move(result.text);
}

std::string StreamRehydrator::process_chunk(std::string_view chunk) {
    if (cancelled_) return {};

    buffer_.append(chunk);

    const size_t hold = deanonymizer_.rehydrator().pending_token_start(buffer_);
    if (hold == std::string::npos) {
        std::string ready = std::move(buffer_);
        buffer_.clear();
        return restore(ready);
    }

    std::string ready = buffer_.substr(0, hold);
    buffer_.erase(0, hold);
    return restore(ready);
}

std::string StreamRehydrator::flush() {
    if (cancelled_) return {};
    std::string rest = std::move(buffer_);
    buffer_.clear();
    return restore(rest);
}

void StreamRehydrator::cancel() {
    cancelled_ = true;
    buffer_.clear();
    buffer_.shrink_to_fit();
}

} // namespace airlock
