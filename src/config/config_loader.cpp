#include "config/config_loader.hpp"
#include "core/placeholder.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <regex>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace airlock {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (const auto& [key, val] : overlay) {
        if (val.is_table() && base.contains(key) && base[key].is_table()) {
            merge_tables(*base[key].as_table(), *val.as_table());
        } else if (val.is_array() && base.contains(key) && base[key].is_array()) {
            auto& base_arr = *base[key].as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > 10) {
        throw std::runtime_error("Config include depth exceeds 10 (circular include?)");
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Merge: included is base, root is overlay (main wins)
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

// Entity type as written in config -> placeholder type name; "*" passes through
// "*" (every type) is only meaningful for allowlists
std::string config_entity_type(const std::string& raw, std::string_view where,
                               bool allow_wildcard = false) {
    if (raw == "*") {
        if (allow_wildcard) return raw;
        throw std::runtime_error(std::format("{}: '*' is only allowed for allowlists", where));
    }
    auto normalized = placeholder::normalize_entity_type(raw);
    if (!normalized) {
        throw std::runtime_error(std::format("{}: invalid entity type '{}'", where, raw));
    }
    return *normalized;
}

RiskLevel config_risk_level(const std::string& raw, std::string_view where) {
    const auto level = parse_risk_level(utils::to_lower(raw));
    if (!level) {
        throw std::runtime_error(std::format("{}: unknown risk level '{}'", where, raw));
    }
    return *level;
}

bool regex_compiles(const std::string& pattern) {
    try {
        std::regex re(pattern);
        return true;
    } catch (const std::regex_error&) {
        return false;
    }
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

AnonymizerSection ConfigLoader::extract_anonymizer(const toml::table& root) {
    AnonymizerSection cfg;
    const auto* anon = root["anonymizer"].as_table();
    if (!anon) return cfg;
    const auto& a = *anon;

    cfg.language = a["language"].value_or(cfg.language);
    cfg.score_threshold = a["score_threshold"].value_or(cfg.score_threshold);
    cfg.allowlist_enabled = a["allowlist_enabled"].value_or(cfg.allowlist_enabled);
    cfg.allowlist_dir = a["allowlist_dir"].value_or(cfg.allowlist_dir);
    cfg.intent_detection_enabled = a["intent_detection_enabled"].value_or(cfg.intent_detection_enabled);

    if (a.contains("question_favoring_types")) {
        cfg.question_favoring_types.clear();
        for (const auto& type : toml_string_array(a, "question_favoring_types")) {
            cfg.question_favoring_types.push_back(
                config_entity_type(type, "anonymizer.question_favoring_types"));
        }
    }

    if (const auto scope = toml_optional_string(a, "dedup_scope")) {
        const auto parsed = parse_dedup_scope(utils::to_lower(*scope));
        if (!parsed) {
            throw std::runtime_error(
                std::format("anonymizer.dedup_scope: unknown scope '{}'", *scope));
        }
        cfg.dedup_scope = *parsed;
    }

    if (const auto* strategies = a["strategies"].as_table()) {
        for (const auto& [key, val] : *strategies) {
            const std::string type(key.str());
            const auto where = std::format("anonymizer.strategies.{}", type);
            const auto name = val.value<std::string>();
            if (!name) {
                throw std::runtime_error(std::format("{}: expected a string", where));
            }
            const auto strategy = parse_strategy(utils::to_lower(*name));
            if (!strategy) {
                throw std::runtime_error(std::format("{}: unknown strategy '{}'", where, *name));
            }
            cfg.strategies[config_entity_type(type, where)] = *strategy;
        }
    }
    return cfg;
}

DeanonymizerSection ConfigLoader::extract_deanonymizer(const toml::table& root) {
    DeanonymizerSection cfg;
    const auto* deanon = root["deanonymizer"].as_table();
    if (!deanon) return cfg;

    cfg.fuzzy_matching = (*deanon)["fuzzy_matching"].value_or(cfg.fuzzy_matching);
    return cfg;
}

StoreSection ConfigLoader::extract_store(const toml::table& root) {
    StoreSection cfg;
    const auto* store = root["store"].as_table();
    if (!store) return cfg;
    const auto& s = *store;

    cfg.backend = utils::to_lower(s["backend"].value_or(cfg.backend));
    cfg.default_ttl_seconds = s["default_ttl_seconds"].value_or(cfg.default_ttl_seconds);
    cfg.cleanup_interval_seconds = s["cleanup_interval_seconds"].value_or(cfg.cleanup_interval_seconds);
    cfg.redis_url = s["redis_url"].value_or(cfg.redis_url);
    cfg.key_prefix = s["key_prefix"].value_or(cfg.key_prefix);
    return cfg;
}

SecretScannerSection ConfigLoader::extract_secret_scanner(const toml::table& root) {
    SecretScannerSection cfg;
    const auto* scanner = root["secret_scanner"].as_table();
    if (!scanner) return cfg;
    const auto& s = *scanner;

    cfg.enabled = s["enabled"].value_or(cfg.enabled);
    cfg.enable_predefined = s["enable_predefined"].value_or(cfg.enable_predefined);
    cfg.max_match_length = s["max_match_length"].value_or(cfg.max_match_length);

    if (s["block_on_risk"].is_array()) {
        cfg.block_on_risk.clear();
        for (const auto& level : toml_string_array(s, "block_on_risk")) {
            cfg.block_on_risk.push_back(config_risk_level(level, "secret_scanner.block_on_risk"));
        }
    }

    if (const auto* arr = s["patterns"].as_array()) {
        for (size_t i = 0; i < arr->size(); ++i) {
            const auto* p = (*arr)[i].as_table();
            if (!p) continue;
            const auto where = std::format("secret_scanner.patterns[{}]", i);

            SecretPatternDef def;
            def.name = (*p)["name"].value_or(""s);
            def.secret_type = (*p)["type"].value_or(""s);
            def.regex = (*p)["regex"].value_or(""s);
            def.risk_level = config_risk_level((*p)["risk_level"].value_or("high"s), where);
            def.description = (*p)["description"].value_or(""s);
            def.case_insensitive = (*p)["case_insensitive"].value_or(false);
            cfg.patterns.push_back(std::move(def));
        }
    }
    return cfg;
}

std::vector<CustomPatternConfig> ConfigLoader::extract_patterns(const toml::table& root) {
    std::vector<CustomPatternConfig> result;
    const auto* arr = root["patterns"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* p = (*arr)[i].as_table();
        if (!p) continue;

        CustomPatternConfig cfg;
        cfg.name = (*p)["name"].value_or(""s);
        cfg.entity_type = config_entity_type((*p)["entity_type"].value_or(""s),
                                             std::format("patterns[{}].entity_type", i));
        cfg.regex = (*p)["regex"].value_or(""s);
        cfg.score = (*p)["score"].value_or(cfg.score);
        cfg.context = toml_string_array(*p, "context");
        cfg.languages = toml_string_array(*p, "languages");
        result.push_back(std::move(cfg));
    }
    return result;
}

std::vector<AllowlistConfig> ConfigLoader::extract_allowlists(const toml::table& root) {
    std::vector<AllowlistConfig> result;
    const auto* arr = root["allowlists"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (size_t i = 0; i < arr->size(); ++i) {
        const auto* l = (*arr)[i].as_table();
        if (!l) continue;

        AllowlistConfig cfg;
        cfg.name = (*l)["name"].value_or(""s);
        cfg.entity_type = config_entity_type((*l)["entity_type"].value_or("*"s),
                                             std::format("allowlists[{}].entity_type", i),
                                             true);
        cfg.enabled = (*l)["enabled"].value_or(cfg.enabled);
        cfg.case_sensitive = (*l)["case_sensitive"].value_or(cfg.case_sensitive);
        cfg.entries = toml_string_array(*l, "entries");
        cfg.file = (*l)["file"].value_or(""s);
        result.push_back(std::move(cfg));
    }
    return result;
}

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = utils::to_lower((*logging)["level"].value_or(cfg.level));
    return cfg;
}

// ---- Shared extraction + validation ----------------------------------------

AirlockConfig ConfigLoader::extract_all_sections(const toml::table& tbl) {
    AirlockConfig config;
    config.anonymizer = extract_anonymizer(tbl);
    config.deanonymizer = extract_deanonymizer(tbl);
    config.store = extract_store(tbl);
    config.secret_scanner = extract_secret_scanner(tbl);
    config.patterns = extract_patterns(tbl);
    config.allowlists = extract_allowlists(tbl);
    config.logging = extract_logging(tbl);
    return config;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AirlockConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        auto config = extract_all_sections(tbl);

        namespace fs = std::filesystem;
        const auto base_dir = fs::path(config_path).parent_path();
        const auto resolve = [&](std::string& path) {
            if (!path.empty() && fs::path(path).is_relative()) {
                path = (base_dir / path).lexically_normal().string();
            }
        };
        for (auto& list : config.allowlists) {
            resolve(list.file);
        }
        resolve(config.anonymizer.allowlist_dir);

        auto result = validate_and_return(std::move(config));
        if (result.success) {
            utils::log::info(std::format("Config loaded from {}", config_path));
        }
        return result;
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AirlockConfig& config) {
    std::vector<std::string> errors;

    const auto& anon = config.anonymizer;
    if (anon.language.empty()) {
        errors.push_back("anonymizer.language must not be empty");
    }
    if (anon.score_threshold < 0.0 || anon.score_threshold > 1.0) {
        errors.push_back(std::format("anonymizer.score_threshold must be within [0, 1], got {}",
                                     anon.score_threshold));
    }

    const auto& store = config.store;
    if (store.backend != "memory" && store.backend != "redis") {
        errors.push_back(std::format("store.backend must be 'memory' or 'redis', got '{}'",
                                     store.backend));
    }
    if (store.default_ttl_seconds <= 0) {
        errors.push_back(std::format("store.default_ttl_seconds must be > 0, got {}",
                                     store.default_ttl_seconds));
    }
    if (store.cleanup_interval_seconds <= 0) {
        errors.push_back(std::format("store.cleanup_interval_seconds must be > 0, got {}",
                                     store.cleanup_interval_seconds));
    }
    if (store.key_prefix.empty()) {
        errors.push_back("store.key_prefix must not be empty");
    }
    if (store.backend == "redis" && store.redis_url.empty()) {
        errors.push_back("store.redis_url required when backend is 'redis'");
    }

    const auto& scanner = config.secret_scanner;
    if (scanner.max_match_length <= 0) {
        errors.push_back(std::format("secret_scanner.max_match_length must be > 0, got {}",
                                     scanner.max_match_length));
    }
    for (size_t i = 0; i < scanner.patterns.size(); ++i) {
        const auto& p = scanner.patterns[i];
        if (p.name.empty()) {
            errors.push_back(std::format("secret_scanner.patterns[{}].name must not be empty", i));
        }
        if (p.secret_type.empty()) {
            errors.push_back(std::format("secret_scanner.patterns[{}].type must not be empty", i));
        }
        if (p.regex.empty() || !regex_compiles(p.regex)) {
            errors.push_back(std::format("secret_scanner.patterns[{}].regex is invalid: '{}'",
                                         i, p.regex));
        }
    }

    std::unordered_set<std::string> pattern_names;
    for (size_t i = 0; i < config.patterns.size(); ++i) {
        const auto& p = config.patterns[i];
        if (p.name.empty()) {
            errors.push_back(std::format("patterns[{}].name must not be empty", i));
        } else if (!pattern_names.insert(p.name).second) {
            errors.push_back(std::format("patterns[{}].name '{}' is duplicated", i, p.name));
        }
        if (p.regex.empty() || !regex_compiles(p.regex)) {
            errors.push_back(std::format("patterns[{}].regex is invalid: '{}'", i, p.regex));
        }
        if (p.score < 0.0 || p.score > 1.0) {
            errors.push_back(std::format("patterns[{}].score must be within [0, 1], got {}",
                                         i, p.score));
        }
    }

    std::unordered_set<std::string> list_names;
    for (size_t i = 0; i < config.allowlists.size(); ++i) {
        const auto& l = config.allowlists[i];
        if (l.name.empty()) {
            errors.push_back(std::format("allowlists[{}].name must not be empty", i));
        } else if (!list_names.insert(l.name).second) {
            errors.push_back(std::format("allowlists[{}].name '{}' is duplicated", i, l.name));
        }
        if (l.entries.empty() && l.file.empty()) {
            errors.push_back(std::format("allowlists[{}] needs entries or a file", i));
        }
    }

    const auto& level = config.logging.level;
    if (level != "info" && level != "warn" && level != "warning" && level != "error") {
        errors.push_back(std::format("logging.level must be info, warn or error, got '{}'", level));
    }

    return errors;
}

} // namespace airlock
