#ifdef ENABLE_REDIS

#include "storage/redis_mapping_store.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <sw/redis++/redis++.h>

#include <format>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace airlock {

namespace {

constexpr const char* kMappingField = "mapping";
constexpr const char* kTtlField = "ttl";

// KEYS[1] = entry, ARGV[1] = new ttl or "" for the entry's saved ttl
constexpr const char* kExtendScript = R"lua(
if redis.call('EXISTS', KEYS[1]) == 0 then return 0 end
local ttl = ARGV[1]
if ttl == '' then ttl = redis.call('HGET', KEYS[1], 'ttl') end
if not ttl then return 0 end
redis.call('HSET', KEYS[1], 'ttl', ttl)
return redis.call('EXPIRE', KEYS[1], ttl)
)lua";

} // anonymous namespace

RedisMappingStore::RedisMappingStore(Config config)
    : config_(std::move(config)) {
    if (config_.default_ttl.count() <= 0) {
        throw std::invalid_argument("default_ttl must be positive");
    }
    try {
        redis_ = std::make_unique<sw::redis::Redis>(config_.url);
    } catch (const sw::redis::Error& e) {
        fail("connect", e);
    }
    utils::log::info(std::format("Redis mapping store: {} (prefix '{}')",
                                 config_.url, config_.key_prefix));
}

RedisMappingStore::~RedisMappingStore() = default;

void RedisMappingStore::fail(std::string_view operation, const std::exception& e) {
    backend_errors_.fetch_add(1, std::memory_order_relaxed);
    auto message = std::format("Redis {} failed: {}", operation, e.what());
    utils::log::error(message);
    throw StoreError(std::move(message));
}

void RedisMappingStore::save(const std::string& tenant_id,
                             const std::string& session_id,
                             const SessionMapping& mapping,
                             std::optional<std::chrono::seconds> ttl) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    const auto effective = ttl.value_or(config_.default_ttl);
    if (effective.count() <= 0) {
        throw std::invalid_argument("ttl must be positive");
    }

    const std::vector<std::pair<std::string, std::string>> fields = {
        {kMappingField, mapping.to_json()},
        {kTtlField, std::to_string(effective.count())},
    };
    try {
        auto tx = redis_->transaction();
        tx.del(key).hmset(key, fields.begin(), fields.end()).expire(key, effective).exec();
    } catch (const sw::redis::Error& e) {
        fail("HMSET", e);
    }
}

std::optional<SessionMapping> RedisMappingStore::get(const std::string& tenant_id,
                                                     const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);

    sw::redis::OptionalString payload;
    try {
        payload = redis_->hget(key, kMappingField);
    } catch (const sw::redis::Error& e) {
        fail("HGET", e);
    }
    if (!payload) {
        return std::nullopt;
    }

    try {
        return SessionMapping::from_json(*payload);
    } catch (const std::invalid_argument& e) {
        fail("decode", e);
    }
}

bool RedisMappingStore::remove(const std::string& tenant_id, const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    try {
        return redis_->del(key) > 0;
    } catch (const sw::redis::Error& e) {
        fail("DEL", e);
    }
}

bool RedisMappingStore::exists(const std::string& tenant_id, const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    try {
        return redis_->exists(key) > 0;
    } catch (const sw::redis::Error& e) {
        fail("EXISTS", e);
    }
}

bool RedisMappingStore::extend_ttl(const std::string& tenant_id,
                                   const std::string& session_id,
                                   std::optional<std::chrono::seconds> ttl) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("ttl must be positive");
    }
    const std::vector<std::string> keys = {key};
    const std::vector<std::string> args = {ttl ? std::to_string(ttl->count()) : std::string()};
    try {
        return redis_->eval<long long>(kExtendScript, keys.begin(), keys.end(),
                                       args.begin(), args.end()) == 1;
    } catch (const sw::redis::Error& e) {
        fail("EXTEND", e);
    }
}

size_t RedisMappingStore::delete_tenant_keys(const std::string& tenant_id) {
    if (!is_valid_tenant_id(tenant_id)) {
        throw std::invalid_argument(std::format("Invalid tenant id '{}'", tenant_id));
    }
    const auto pattern = std::format("{}{}:*", config_.key_prefix, tenant_id);

    size_t removed = 0;
    try {
        long long cursor = 0;
        std::vector<std::string> keys;
        do {
            keys.clear();
            cursor = redis_->scan(cursor, pattern, config_.scan_batch, std::back_inserter(keys));
            if (!keys.empty()) {
                removed += static_cast<size_t>(redis_->del(keys.begin(), keys.end()));
            }
        } while (cursor != 0);
    } catch (const sw::redis::Error& e) {
        fail("SCAN/DEL", e);
    }

    if (removed > 0) {
        utils::log::info(std::format("Mapping store: removed {} session(s) of tenant '{}'",
                                     removed, tenant_id));
    }
    return removed;
}

} // namespace airlock

#endif // ENABLE_REDIS
