#pragma once

#include "storage/mapping_store.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace airlock {

/**
 * @brief In-process mapping store with a background expiry sweep.
 *
 * Reads treat expired entries as absent even before the sweep removes
 * them. Not shared between processes: use the Redis store when more than
 * one proxy instance serves the same sessions.
 */
class MemoryMappingStore : public IMappingStore {
public:
    struct Config {
        std::chrono::seconds default_ttl{300};
        std::chrono::milliseconds cleanup_interval{60'000};
        bool start_cleanup_thread = true;
        std::string key_prefix = std::string(kDefaultKeyPrefix);
    };

    MemoryMappingStore() : MemoryMappingStore(Config{}) {}
    explicit MemoryMappingStore(Config config);
    ~MemoryMappingStore() override;

    MemoryMappingStore(const MemoryMappingStore&) = delete;
    MemoryMappingStore& operator=(const MemoryMappingStore&) = delete;

    void save(const std::string& tenant_id,
              const std::string& session_id,
              const SessionMapping& mapping,
              std::optional<std::chrono::seconds> ttl = std::nullopt) override;

    [[nodiscard]] std::optional<SessionMapping> get(const std::string& tenant_id,
                                                    const std::string& session_id) override;

    bool remove(const std::string& tenant_id, const std::string& session_id) override;

    [[nodiscard]] bool exists(const std::string& tenant_id,
                              const std::string& session_id) override;

    bool extend_ttl(const std::string& tenant_id,
                    const std::string& session_id,
                    std::optional<std::chrono::seconds> ttl = std::nullopt) override;

    size_t delete_tenant_keys(const std::string& tenant_id) override;

    [[nodiscard]] const char* backend_name() const override { return "memory"; }

    /**
     * @brief Drop every expired entry now
     * @return Number of entries removed
     */
    size_t cleanup_expired();

    [[nodiscard]] size_t size() const;
    void clear();

    /**
     * @brief Stop the sweep thread (idempotent; also run by the destructor)
     */
    void shutdown();

    struct Stats {
        uint64_t saves;
        uint64_t hits;
        uint64_t misses;
        uint64_t expired_evictions;
        uint64_t sweeps;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .saves = saves_.load(std::memory_order_relaxed),
            .hits = hits_.load(std::memory_order_relaxed),
            .misses = misses_.load(std::memory_order_relaxed),
            .expired_evictions = expired_evictions_.load(std::memory_order_relaxed),
            .sweeps = sweeps_.load(std::memory_order_relaxed),
        };
    }

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        SessionMapping mapping;
        std::chrono::seconds ttl;
        Clock::time_point expires_at;
    };

    void cleanup_loop();

    Config config_;

    std::unordered_map<std::string, Entry> entries_;
    mutable std::shared_mutex mutex_;

    // Background sweep
    std::thread cleanup_thread_;
    std::atomic<bool> cleanup_running_{false};
    std::mutex cleanup_mutex_;
    std::condition_variable cleanup_cv_;

    std::atomic<uint64_t> saves_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> expired_evictions_{0};
    std::atomic<uint64_t> sweeps_{0};
};

} // namespace airlock
