#pragma once

#include "core/deanonymizer.hpp"
#include "core/session_mapping.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

/**
 * @brief Incremental deanonymization of a streamed LLM response
 *
 * Chunks may split a placeholder anywhere. The tail of the stream is held
 * back only while it could still grow into a token, and never more than
 * placeholder::kMaxPlaceholderLength bytes.
 *
 * Not thread-safe; one instance per response stream.
 */
class StreamRehydrator {
public:
    /**
     * @param mapping Session mapping, or nullptr when none was found
     */
    StreamRehydrator(std::shared_ptr<const SessionMapping> mapping,
                     const Deanonymizer& deanonymizer);

    /**
     * @brief Feed one chunk; returns the text that is now safe to emit
     */
    [[nodiscard]] std::string process_chunk(std::string_view chunk);

    /**
     * @brief End of stream: restore and return everything still buffered
     */
    [[nodiscard]] std::string flush();

    /**
     * @brief Client went away: drop buffered content, ignore further chunks
     */
    void cancel();

    [[nodiscard]] bool cancelled() const { return cancelled_; }
    [[nodiscard]] bool has_pending() const { return !buffer_.empty(); }
    [[nodiscard]] size_t pending_length() const { return buffer_.size(); }

    [[nodiscard]] size_t replaced_count() const { return replaced_count_; }
    [[nodiscard]] const std::vector<std::string>& unresolved() const { return unresolved_; }
    [[nodiscard]] bool is_complete() const { return unresolved_.empty(); }

private:
    std::string restore(std::string_view text);

    std::shared_ptr<const SessionMapping> mapping_;
    const Deanonymizer& deanonymizer_;

    std::string buffer_;
    bool cancelled_ = false;
    size_t replaced_count_ = 0;
    std::vector<std::string> unresolved_;
};

} // namespace airlock
