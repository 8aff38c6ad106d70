#pragma once

#include "core/session_mapping.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace airlock {

/**
 * @brief Abstract, tenant-namespaced persistence for session mappings.
 *
 * Implementations can be in-process (single node, background sweep) or
 * Redis-backed (shared across nodes, native key expiry). Backend failures
 * surface as StoreError; a missing or expired entry is not an error.
 */
class IMappingStore {
public:
    virtual ~IMappingStore() = default;

    /**
     * @param ttl Overrides the backend's default time-to-live
     */
    virtual void save(const std::string& tenant_id,
                      const std::string& session_id,
                      const SessionMapping& mapping,
                      std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

    [[nodiscard]] virtual std::optional<SessionMapping> get(const std::string& tenant_id,
                                                            const std::string& session_id) = 0;

    virtual bool remove(const std::string& tenant_id, const std::string& session_id) = 0;

    [[nodiscard]] virtual bool exists(const std::string& tenant_id,
                                      const std::string& session_id) = 0;

    /**
     * @brief Restart the countdown of a live entry
     *
     * A given ttl replaces the entry's own; without one the ttl the entry
     * was saved (or last extended) with applies again.
     * @return false if the entry is missing or already expired
     */
    virtual bool extend_ttl(const std::string& tenant_id,
                            const std::string& session_id,
                            std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

    /**
     * @return Number of sessions removed
     */
    virtual size_t delete_tenant_keys(const std::string& tenant_id) = 0;

    [[nodiscard]] virtual const char* backend_name() const = 0;

    /**
     * @brief Tenant ids: ASCII letters, digits, '_', '-', '.'; 1..64 bytes
     *
     * Keeps "<prefix><tenant>:<session>" unambiguous and glob-safe.
     */
    [[nodiscard]] static bool is_valid_tenant_id(std::string_view tenant_id);

    /**
     * @throws std::invalid_argument on an invalid tenant id or empty session id
     */
    [[nodiscard]] static std::string make_key(std::string_view prefix,
                                              std::string_view tenant_id,
                                              std::string_view session_id);
};

inline constexpr std::string_view kDefaultKeyPrefix = "pii_airlock:mapping:";
inline constexpr std::string_view kDefaultTenant = "default";

} // namespace airlock
