#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace airlock {

/**
 * @brief Named set of values that must never be anonymized
 *
 * entity_type "*" applies the list to every type. Entries are stored
 * trimmed, and lowercased (ASCII) when the list is case-insensitive.
 */
struct Allowlist {
    std::string name;
    std::string entity_type = "*";
    bool enabled = true;
    bool case_sensitive = false;
    std::unordered_set<std::string> entries;
};

/**
 * @brief Registry of allowlists consulted by the Anonymizer
 *
 * Thread-safe: lookups take a shared lock, edits an exclusive one.
 */
class AllowlistRegistry {
public:
    struct Summary {
        std::string name;
        std::string entity_type;
        bool enabled;
        size_t entry_count;
    };

    /**
     * @brief Add or replace a list (by name)
     */
    void register_list(Allowlist list);
    bool remove_list(const std::string& name);

    bool add_entry(const std::string& list_name, std::string_view entry);
    bool remove_entry(const std::string& list_name, std::string_view entry);
    bool set_enabled(const std::string& list_name, bool enabled);

    /**
     * @brief True if any enabled list for this type (or "*") contains text
     */
    [[nodiscard]] bool is_exempt(std::string_view entity_type, std::string_view text) const;

    [[nodiscard]] std::vector<Summary> list_allowlists() const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Read one entry per line; blank lines and '#' comments skipped
     * @throws std::runtime_error if the file cannot be opened
     */
    [[nodiscard]] static std::vector<std::string> read_entries(const std::string& path);

    /**
     * @brief Register every *.txt in a directory, named after the file stem
     *
     * The entity type is inferred from the stem ("public_figures" -> PERSON);
     * files that infer nothing apply to every type.
     * @return Number of lists registered
     * @throws std::runtime_error if the directory does not exist
     */
    size_t load_directory(const std::string& directory);

    [[nodiscard]] static std::string infer_entity_type(std::string_view list_name);

private:
    static std::string normalize_entry(std::string_view entry, bool case_sensitive);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Allowlist> lists_;
};

} // namespace airlock
