#include "storage/mapping_store.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace airlock {

bool IMappingStore::is_valid_tenant_id(std::string_view tenant_id) {
    if (tenant_id.empty() || tenant_id.size() > 64) return false;
    return std::all_of(tenant_id.begin(), tenant_id.end(), [](char c) {
        return utils::is_ascii_alpha(c) || utils::is_ascii_digit(c)
            || c == '_' || c == '-' || c == '.';
    });
}

std::string IMappingStore::make_key(std::string_view prefix,
                                    std::string_view tenant_id,
                                    std::string_view session_id) {
    if (!is_valid_tenant_id(tenant_id)) {
        throw std::invalid_argument(std::format("Invalid tenant id '{}'", tenant_id));
    }
    if (session_id.empty()) {
        throw std::invalid_argument("Session id must not be empty");
    }
    return std::format("{}{}:{}", prefix, tenant_id, session_id);
}

} // namespace airlock
