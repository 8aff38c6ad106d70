#include "core/session_mapping.hpp"
#include "core/placeholder.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <mutex>
#include <stdexcept>

namespace airlock {

SessionMapping::SessionMapping(std::string session_id)
    : SessionMapping(std::move(session_id), std::chrono::system_clock::now()) {}

SessionMapping::SessionMapping(std::string session_id,
                               std::chrono::system_clock::time_point created_at)
    : session_id_(std::move(session_id)), created_at_(created_at) {}

SessionMapping::SessionMapping(const SessionMapping& other) {
    std::shared_lock lock(other.mutex_);
    session_id_ = other.session_id_;
    created_at_ = other.created_at_;
    forward_ = other.forward_;
    reverse_ = other.reverse_;
    order_ = other.order_;
    allocator_ = other.allocator_;
}

SessionMapping& SessionMapping::operator=(const SessionMapping& other) {
    if (this == &other) return *this;

    std::unique_lock lock_this(mutex_, std::defer_lock);
    std::shared_lock lock_other(other.mutex_, std::defer_lock);
    std::lock(lock_this, lock_other);

    session_id_ = other.session_id_;
    created_at_ = other.created_at_;
    forward_ = other.forward_;
    reverse_ = other.reverse_;
    order_ = other.order_;
    allocator_ = other.allocator_;
    return *this;
}

void SessionMapping::add(const std::string& entity_type, const std::string& original,
                         const std::string& placeholder) {
    const auto parsed = placeholder::parse_canonical(placeholder);
    if (!parsed) {
        throw std::invalid_argument(
            std::format("Not a canonical placeholder: '{}'", placeholder));
    }
    if (parsed->first != entity_type) {
        throw std::invalid_argument(
            std::format("Placeholder {} does not belong to type {}", placeholder, entity_type));
    }

    std::unique_lock lock(mutex_);
    const auto it = reverse_.find(placeholder);
    if (it != reverse_.end()) {
        if (it->second != original) {
            throw std::invalid_argument(
                std::format("Placeholder {} already bound to a different value", placeholder));
        }
    } else {
        reverse_.emplace(placeholder, original);
        order_.push_back(placeholder);
    }
    forward_[entity_type][original] = placeholder;
    allocator_.observe(entity_type, parsed->second);
}

std::string SessionMapping::allocate_locked(const std::string& entity_type,
                                            const std::string& original) {
    const uint32_t index = allocator_.next(entity_type);
    std::string token = placeholder::make(entity_type, index);
    forward_[entity_type][original] = token;
    reverse_.emplace(token, original);
    order_.push_back(token);
    return token;
}

std::string SessionMapping::get_or_allocate(const std::string& entity_type,
                                            const std::string& original) {
    std::unique_lock lock(mutex_);
    const auto type_it = forward_.find(entity_type);
    if (type_it != forward_.end()) {
        const auto it = type_it->second.find(original);
        if (it != type_it->second.end()) {
            return it->second;
        }
    }
    return allocate_locked(entity_type, original);
}

std::string SessionMapping::allocate(const std::string& entity_type,
                                     const std::string& original) {
    std::unique_lock lock(mutex_);
    return allocate_locked(entity_type, original);
}

std::optional<std::string> SessionMapping::get_original(const std::string& placeholder) const {
    std::shared_lock lock(mutex_);
    const auto it = reverse_.find(placeholder);
    if (it == reverse_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::string> SessionMapping::get_placeholder(const std::string& entity_type,
                                                           const std::string& original) const {
    std::shared_lock lock(mutex_);
    const auto type_it = forward_.find(entity_type);
    if (type_it == forward_.end()) return std::nullopt;
    const auto it = type_it->second.find(original);
    if (it == type_it->second.end()) return std::nullopt;
    return it->second;
}

bool SessionMapping::contains(const std::string& placeholder) const {
    std::shared_lock lock(mutex_);
    return reverse_.contains(placeholder);
}

bool SessionMapping::has_entity_type(const std::string& entity_type) const {
    std::shared_lock lock(mutex_);
    return forward_.contains(entity_type);
}

std::vector<std::string> SessionMapping::all_placeholders() const {
    std::shared_lock lock(mutex_);
    return order_;
}

size_t SessionMapping::size() const {
    std::shared_lock lock(mutex_);
    return reverse_.size();
}

void SessionMapping::clear() {
    std::unique_lock lock(mutex_);
    forward_.clear();
    reverse_.clear();
    order_.clear();
    allocator_.reset();
}

// ============================================================================
// Portable form
// ============================================================================

nlohmann::json SessionMapping::to_portable() const {
    std::shared_lock lock(mutex_);

    nlohmann::json mappings = nlohmann::json::object();
    for (const auto& [type, originals] : forward_) {
        nlohmann::json entries = nlohmann::json::object();
        for (const auto& [original, token] : originals) {
            entries[original] = token;
        }
        mappings[type] = std::move(entries);
    }

    // Tokens superseded by a later allocation for the same original
    nlohmann::json retired = nlohmann::json::object();
    for (const auto& [token, original] : reverse_) {
        const auto parsed = placeholder::parse_canonical(token);
        if (!parsed) continue;
        const auto type_it = forward_.find(parsed->first);
        if (type_it != forward_.end()) {
            const auto it = type_it->second.find(original);
            if (it != type_it->second.end() && it->second == token) continue;
        }
        retired[token] = original;
    }

    nlohmann::json doc = {
        {"sessionId", session_id_},
        {"createdAt", utils::to_epoch_ms(created_at_)},
        {"mappings", std::move(mappings)},
    };
    if (!retired.empty()) {
        doc["retired"] = std::move(retired);
    }
    return doc;
}

std::string SessionMapping::to_json() const {
    return to_portable().dump();
}

SessionMapping SessionMapping::from_portable(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::invalid_argument("Mapping document must be a JSON object");
    }

    std::string session_id;
    if (const auto it = doc.find("sessionId"); it != doc.end()) {
        if (!it->is_string()) throw std::invalid_argument("sessionId must be a string");
        session_id = it->get<std::string>();
    }

    auto created_at = std::chrono::system_clock::now();
    if (const auto it = doc.find("createdAt"); it != doc.end()) {
        if (!it->is_number_integer()) throw std::invalid_argument("createdAt must be an integer");
        created_at = utils::from_epoch_ms(it->get<int64_t>());
    }

    SessionMapping mapping(std::move(session_id), created_at);

    if (const auto it = doc.find("mappings"); it != doc.end()) {
        if (!it->is_object()) throw std::invalid_argument("mappings must be an object");
        for (const auto& [type, entries] : it->items()) {
            if (!entries.is_object()) {
                throw std::invalid_argument(std::format("mappings.{} must be an object", type));
            }
            for (const auto& [original, token] : entries.items()) {
                if (!token.is_string()) {
                    throw std::invalid_argument(
                        std::format("mappings.{} values must be strings", type));
                }
                mapping.add(type, original, token.get<std::string>());
            }
        }
    }

    if (const auto it = doc.find("retired"); it != doc.end()) {
        if (!it->is_object()) throw std::invalid_argument("retired must be an object");
        for (const auto& [token, original] : it->items()) {
            const auto parsed = placeholder::parse_canonical(token);
            if (!parsed || !original.is_string()) {
                throw std::invalid_argument(std::format("Invalid retired entry '{}'", token));
            }
            const auto value = original.get<std::string>();
            const auto existing = mapping.reverse_.find(token);
            if (existing != mapping.reverse_.end()) {
                if (existing->second != value) {
                    throw std::invalid_argument(
                        std::format("Placeholder {} bound to two values", token));
                }
                continue;
            }
            mapping.reverse_.emplace(token, value);
            mapping.order_.push_back(token);
            mapping.allocator_.observe(parsed->first, parsed->second);
        }
    }

    // JSON objects carry no allocation order; rebuild it from (type, index)
    std::sort(mapping.order_.begin(), mapping.order_.end(),
        [](const std::string& a, const std::string& b) {
            const auto pa = placeholder::parse_canonical(a);
            const auto pb = placeholder::parse_canonical(b);
            if (pa->first != pb->first) return pa->first < pb->first;
            return pa->second < pb->second;
        });

    return mapping;
}

SessionMapping SessionMapping::from_json(std::string_view text) {
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::format("Invalid mapping JSON: {}", e.what()));
    }
    return from_portable(doc);
}

} // namespace airlock
