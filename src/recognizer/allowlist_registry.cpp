#include "recognizer/allowlist_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace airlock {

std::string AllowlistRegistry::normalize_entry(std::string_view entry, bool case_sensitive) {
    std::string value = utils::trim(std::string(entry));
    return case_sensitive ? value : utils::to_lower(value);
}

void AllowlistRegistry::register_list(Allowlist list) {
    std::unordered_set<std::string> normalized;
    normalized.reserve(list.entries.size());
    for (const auto& e : list.entries) {
        auto value = normalize_entry(e, list.case_sensitive);
        if (!value.empty()) normalized.insert(std::move(value));
    }
    list.entries = std::move(normalized);

    std::unique_lock lock(mutex_);
    auto name = list.name;
    lists_.insert_or_assign(std::move(name), std::move(list));
}

bool AllowlistRegistry::remove_list(const std::string& name) {
    std::unique_lock lock(mutex_);
    return lists_.erase(name) > 0;
}

bool AllowlistRegistry::add_entry(const std::string& list_name, std::string_view entry) {
    std::unique_lock lock(mutex_);
    const auto it = lists_.find(list_name);
    if (it == lists_.end()) return false;
    auto value = normalize_entry(entry, it->second.case_sensitive);
    if (value.empty()) return false;
    return it->second.entries.insert(std::move(value)).second;
}

bool AllowlistRegistry::remove_entry(const std::string& list_name, std::string_view entry) {
    std::unique_lock lock(mutex_);
    const auto it = lists_.find(list_name);
    if (it == lists_.end()) return false;
    return it->second.entries.erase(normalize_entry(entry, it->second.case_sensitive)) > 0;
}

bool AllowlistRegistry::set_enabled(const std::string& list_name, bool enabled) {
    std::unique_lock lock(mutex_);
    const auto it = lists_.find(list_name);
    if (it == lists_.end()) return false;
    it->second.enabled = enabled;
    return true;
}

bool AllowlistRegistry::is_exempt(std::string_view entity_type, std::string_view text) const {
    std::shared_lock lock(mutex_);
    if (lists_.empty()) return false;

    const std::string trimmed = utils::trim(std::string(text));
    if (trimmed.empty()) return false;
    const std::string lowered = utils::to_lower(trimmed);

    for (const auto& [name, list] : lists_) {
        if (!list.enabled) continue;
        if (list.entity_type != "*" && list.entity_type != entity_type) continue;
        if (list.entries.contains(list.case_sensitive ? trimmed : lowered)) {
            return true;
        }
    }
    return false;
}

std::vector<AllowlistRegistry::Summary> AllowlistRegistry::list_allowlists() const {
    std::shared_lock lock(mutex_);
    std::vector<Summary> out;
    out.reserve(lists_.size());
    for (const auto& [name, list] : lists_) {
        out.push_back({list.name, list.entity_type, list.enabled, list.entries.size()});
    }
    std::sort(out.begin(), out.end(),
              [](const Summary& a, const Summary& b) { return a.name < b.name; });
    return out;
}

size_t AllowlistRegistry::size() const {
    std::shared_lock lock(mutex_);
    return lists_.size();
}

std::vector<std::string> AllowlistRegistry::read_entries(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(std::format("Cannot open allowlist file: {}", path));
    }

    std::vector<std::string> entries;
    std::string line;
    while (std::getline(in, line)) {
        auto value = utils::trim(line);
        if (value.empty() || value.front() == '#') continue;
        entries.push_back(std::move(value));
    }
    return entries;
}

std::string AllowlistRegistry::infer_entity_type(std::string_view list_name) {
    const std::string name = utils::to_lower(list_name);
    const auto has = [&](std::string_view s) { return name.find(s) != std::string::npos; };

    if (has("person") || has("figure") || has("name")) return "PERSON";
    if (has("location") || has("place") || has("city")) return "LOCATION";
    if (has("org") || has("company")) return "ORG";
    if (has("email")) return "EMAIL";
    if (has("phone")) return "PHONE";
    return "*";
}

size_t AllowlistRegistry::load_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    if (!fs::is_directory(directory)) {
        throw std::runtime_error(std::format("Allowlist directory not found: {}", directory));
    }

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(directory)) {
        if (entry.is_regular_file() && entry.path().extension() == ".txt") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    size_t count = 0;
    for (const auto& path : files) {
        const auto entries = read_entries(path.string());
        if (entries.empty()) continue;

        Allowlist list;
        list.name = path.stem().string();
        list.entity_type = infer_entity_type(list.name);
        list.entries.insert(entries.begin(), entries.end());
        utils::log::info(std::format("Allowlist '{}' loaded: {} entries (type {})",
                                     list.name, entries.size(), list.entity_type));
        register_list(std::move(list));
        ++count;
    }
    return count;
}

} // namespace airlock
