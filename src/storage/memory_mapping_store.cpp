#include "storage/memory_mapping_store.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace airlock {

MemoryMappingStore::MemoryMappingStore(Config config)
    : config_(std::move(config)) {
    if (config_.default_ttl.count() <= 0) {
        throw std::invalid_argument("default_ttl must be positive");
    }
    if (config_.start_cleanup_thread && config_.cleanup_interval.count() > 0) {
        cleanup_running_.store(true, std::memory_order_release);
        cleanup_thread_ = std::thread([this]() { cleanup_loop(); });
    }
}

MemoryMappingStore::~MemoryMappingStore() {
    shutdown();
}

void MemoryMappingStore::shutdown() {
    {
        std::lock_guard<std::mutex> lock(cleanup_mutex_);
        cleanup_running_.store(false, std::memory_order_release);
    }
    cleanup_cv_.notify_all();
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.join();
    }
}

void MemoryMappingStore::save(const std::string& tenant_id,
                              const std::string& session_id,
                              const SessionMapping& mapping,
                              std::optional<std::chrono::seconds> ttl) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    const auto effective = ttl.value_or(config_.default_ttl);
    if (effective.count() <= 0) {
        throw std::invalid_argument("ttl must be positive");
    }

    Entry entry{mapping, effective, Clock::now() + effective};
    {
        std::unique_lock lock(mutex_);
        entries_.insert_or_assign(key, std::move(entry));
    }
    saves_.fetch_add(1, std::memory_order_relaxed);
}

std::optional<SessionMapping> MemoryMappingStore::get(const std::string& tenant_id,
                                                      const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    const auto now = Clock::now();

    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires_at <= now) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second.mapping;
}

bool MemoryMappingStore::remove(const std::string& tenant_id, const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    std::unique_lock lock(mutex_);
    return entries_.erase(key) > 0;
}

bool MemoryMappingStore::exists(const std::string& tenant_id, const std::string& session_id) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    const auto now = Clock::now();

    std::shared_lock lock(mutex_);
    const auto it = entries_.find(key);
    return it != entries_.end() && it->second.expires_at > now;
}

bool MemoryMappingStore::extend_ttl(const std::string& tenant_id,
                                    const std::string& session_id,
                                    std::optional<std::chrono::seconds> ttl) {
    const auto key = make_key(config_.key_prefix, tenant_id, session_id);
    if (ttl && ttl->count() <= 0) {
        throw std::invalid_argument("ttl must be positive");
    }
    const auto now = Clock::now();

    std::unique_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end() || it->second.expires_at <= now) {
        return false;
    }
    if (ttl) {
        it->second.ttl = *ttl;
    }
    it->second.expires_at = now + it->second.ttl;
    return true;
}

size_t MemoryMappingStore::delete_tenant_keys(const std::string& tenant_id) {
    if (!is_valid_tenant_id(tenant_id)) {
        throw std::invalid_argument(std::format("Invalid tenant id '{}'", tenant_id));
    }
    const auto tenant_prefix = std::format("{}{}:", config_.key_prefix, tenant_id);

    std::unique_lock lock(mutex_);
    const auto removed = std::erase_if(entries_, [&](const auto& kv) {
        return kv.first.starts_with(tenant_prefix);
    });
    lock.unlock();

    if (removed > 0) {
        utils::log::info(std::format("Mapping store: removed {} session(s) of tenant '{}'",
                                     removed, tenant_id));
    }
    return removed;
}

size_t MemoryMappingStore::cleanup_expired() {
    const auto now = Clock::now();

    std::unique_lock lock(mutex_);
    const auto removed = std::erase_if(entries_, [&](const auto& kv) {
        return kv.second.expires_at <= now;
    });
    lock.unlock();

    sweeps_.fetch_add(1, std::memory_order_relaxed);
    expired_evictions_.fetch_add(removed, std::memory_order_relaxed);
    return removed;
}

size_t MemoryMappingStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void MemoryMappingStore::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
}

void MemoryMappingStore::cleanup_loop() {
    while (cleanup_running_.load(std::memory_order_acquire)) {
        // Wait for cleanup interval or shutdown signal
        {
            std::unique_lock<std::mutex> lock(cleanup_mutex_);
            cleanup_cv_.wait_for(lock, config_.cleanup_interval,
                [this]() { return !cleanup_running_.load(std::memory_order_acquire); });
        }

        if (!cleanup_running_.load(std::memory_order_acquire)) break;

        const auto removed = cleanup_expired();
        if (removed > 0) {
            utils::log::info(std::format("Mapping store sweep: {} expired session(s) removed",
                                         removed));
        }
    }
}

} // namespace airlock
