#pragma once

#ifdef ENABLE_REDIS

#include "storage/mapping_store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace sw::redis {
class Redis;
}

namespace airlock {

/**
 * @brief Redis-backed mapping store (redis-plus-plus)
 *
 * Each entry is a hash under "<key_prefix><tenant>:<session>" holding the
 * portable JSON ("mapping") and the ttl it was saved with ("ttl"). Expiry
 * is handled by Redis itself; extend_ttl without a ttl reapplies the saved
 * one, like MemoryMappingStore. Every redis++ error is rethrown as StoreError.
 */
class RedisMappingStore : public IMappingStore {
public:
    struct Config {
        std::string url = "tcp://127.0.0.1:6379";
        std::string key_prefix = std::string(kDefaultKeyPrefix);
        std::chrono::seconds default_ttl{300};
        long long scan_batch = 100;
    };

    /**
     * @throws StoreError if the connection options are rejected
     */
    explicit RedisMappingStore(Config config);
    ~RedisMappingStore() override;

    RedisMappingStore(const RedisMappingStore&) = delete;
    RedisMappingStore& operator=(const RedisMappingStore&) = delete;

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

    [[nodiscard]] const char* backend_name() const override { return "redis"; }

    [[nodiscard]] uint64_t backend_errors() const {
        return backend_errors_.load(std::memory_order_relaxed);
    }

private:
    [[noreturn]] void fail(std::string_view operation, const std::exception& e);

    Config config_;
    std::unique_ptr<sw::redis::Redis> redis_;
    std::atomic<uint64_t> backend_errors_{0};
};

} // namespace airlock

#endif // ENABLE_REDIS
