#include "core/placeholder_allocator.hpp"
#include "core/placeholder.hpp"

#include <format>
#include <stdexcept>

namespace airlock {

PlaceholderAllocator::PlaceholderAllocator(const PlaceholderAllocator& other) {
    std::lock_guard<std::mutex> lock(other.mutex_);
    counters_ = other.counters_;
}

PlaceholderAllocator& PlaceholderAllocator::operator=(const PlaceholderAllocator& other) {
    if (this != &other) {
        std::scoped_lock lock(mutex_, other.mutex_);
        counters_ = other.counters_;
    }
    return *this;
}

uint32_t PlaceholderAllocator::next(const std::string& entity_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counter = counters_[entity_type];
    if (counter >= placeholder::kMaxIndex) {
        throw std::overflow_error(
            std::format("Placeholder index space exhausted for type {}", entity_type));
    }
    return ++counter;
}

uint32_t PlaceholderAllocator::current(const std::string& entity_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(entity_type);
    return it != counters_.end() ? it->second : 0;
}

void PlaceholderAllocator::observe(const std::string& entity_type, uint32_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& counter = counters_[entity_type];
    if (index > counter) counter = index;
}

void PlaceholderAllocator::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
}

std::unordered_map<std::string, uint32_t> PlaceholderAllocator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace airlock
