#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace airlock {

/**
 * @brief Per-type sequential index source for one session mapping
 *
 * Indices start at 1 and are never handed out twice. The lock is held
 * only for the map lookup and increment.
 */
class PlaceholderAllocator {
public:
    PlaceholderAllocator() = default;
    PlaceholderAllocator(const PlaceholderAllocator& other);
    PlaceholderAllocator& operator=(const PlaceholderAllocator& other);

    /**
     * @brief Allocate the next index for a type
     * @throws std::overflow_error when the type's index space is exhausted
     */
    [[nodiscard]] uint32_t next(const std::string& entity_type);

    /**
     * @brief Last index handed out for a type (0 if none)
     */
    [[nodiscard]] uint32_t current(const std::string& entity_type) const;

    /**
     * @brief Raise the counter so that `index` is never allocated again
     *
     * Used when rebuilding a mapping from its portable form.
     */
    void observe(const std::string& entity_type, uint32_t index);

    /**
     * @brief Forget every counter; only valid together with clearing the mapping
     */
    void reset();

    [[nodiscard]] std::unordered_map<std::string, uint32_t> snapshot() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint32_t> counters_;
};

} // namespace airlock
