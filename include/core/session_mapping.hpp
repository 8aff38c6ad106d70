#pragma once

#include "core/placeholder_allocator.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace airlock {

/**
 * @brief Bidirectional (type, original) <-> placeholder table for one session
 *
 * Invariants:
 * - every placeholder resolves to exactly one original
 * - indices per type come from the owned allocator, first-seen order, never reused
 * - within SESSION dedup, one (type, original) pair has one placeholder
 *
 * Portable form:
 *   {"sessionId": "...", "createdAt": <epoch ms>,
 *    "mappings": {"PERSON": {"张三": "<PERSON_1>"}},
 *    "retired": {"<PERSON_1>": "张三"}}       // only when CALL dedup re-allocated
 */
class SessionMapping {
public:
    explicit SessionMapping(std::string session_id = {});
    SessionMapping(std::string session_id, std::chrono::system_clock::time_point created_at);

    SessionMapping(const SessionMapping& other);
    SessionMapping& operator=(const SessionMapping& other);

    /**
     * @brief Register an explicit pair
     * @throws std::invalid_argument if the placeholder is not canonical, or is
     *         already bound to a different original
     */
    void add(const std::string& entity_type, const std::string& original,
             const std::string& placeholder);

    /**
     * @brief Existing placeholder for the pair, or a freshly allocated one
     */
    [[nodiscard]] std::string get_or_allocate(const std::string& entity_type,
                                              const std::string& original);

    /**
     * @brief Always allocate a new placeholder for the pair
     *
     * The forward entry moves to the new token; earlier tokens for the same
     * original keep resolving.
     */
    [[nodiscard]] std::string allocate(const std::string& entity_type,
                                       const std::string& original);

    [[nodiscard]] std::optional<std::string> get_original(const std::string& placeholder) const;
    [[nodiscard]] std::optional<std::string> get_placeholder(const std::string& entity_type,
                                                             const std::string& original) const;
    [[nodiscard]] bool contains(const std::string& placeholder) const;
    [[nodiscard]] bool has_entity_type(const std::string& entity_type) const;

    /**
     * @brief Placeholders in allocation order
     */
    [[nodiscard]] std::vector<std::string> all_placeholders() const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

    /**
     * @brief Drop every pair and restart numbering
     */
    void clear();

    [[nodiscard]] const std::string& session_id() const { return session_id_; }
    [[nodiscard]] std::chrono::system_clock::time_point created_at() const { return created_at_; }
    [[nodiscard]] uint32_t current_index(const std::string& entity_type) const {
        return allocator_.current(entity_type);
    }

    [[nodiscard]] nlohmann::json to_portable() const;
    [[nodiscard]] std::string to_json() const;

    /**
     * @throws std::invalid_argument on a malformed document
     */
    [[nodiscard]] static SessionMapping from_portable(const nlohmann::json& doc);
    [[nodiscard]] static SessionMapping from_json(std::string_view text);

private:
    // Caller holds mutex_ exclusively
    std::string allocate_locked(const std::string& entity_type, const std::string& original);

    std::string session_id_;
    std::chrono::system_clock::time_point created_at_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> forward_;
    std::unordered_map<std::string, std::string> reverse_;
    std::vector<std::string> order_;

    PlaceholderAllocator allocator_;
};

} // namespace airlock
