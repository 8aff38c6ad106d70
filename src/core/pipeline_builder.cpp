#include "core/pipeline_builder.hpp"
#include "config/config_types.hpp"
#include "core/anonymizer.hpp"
#include "core/deanonymizer.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "recognizer/allowlist_registry.hpp"
#include "recognizer/pattern_recognizer.hpp"
#include "recognizer/recognizer_registry.hpp"
#include "security/secret_interceptor.hpp"
#include "security/secret_scanner.hpp"
#include "storage/memory_mapping_store.hpp"
#ifdef ENABLE_REDIS
#include "storage/redis_mapping_store.hpp"
#endif

#include <format>
#include <stdexcept>

namespace airlock {

std::shared_ptr<AirlockPipeline> PipelineBuilder::build() {
    if (!c_.anonymizer) throw std::runtime_error("PipelineBuilder: anonymizer is required");
    if (!c_.deanonymizer) throw std::runtime_error("PipelineBuilder: deanonymizer is required");
    if (!c_.store) throw std::runtime_error("PipelineBuilder: store is required");

    return std::make_shared<AirlockPipeline>(std::move(c_));
}

std::shared_ptr<AirlockPipeline> PipelineBuilder::from_config(const AirlockConfig& config) {
    // Recognition: built-ins, then one recognizer per [[patterns]] entry
    auto registry = RecognizerRegistry::with_builtins();
    for (const auto& p : config.patterns) {
        registry->add(std::make_unique<PatternRecognizer>(
            p.name, p.entity_type,
            std::vector<PatternRecognizer::Pattern>{{p.name, p.regex, p.score}},
            p.context, p.languages));
    }

    auto allowlists = std::make_shared<AllowlistRegistry>();
    for (const auto& cfg : config.allowlists) {
        Allowlist list;
        list.name = cfg.name;
        list.entity_type = cfg.entity_type;
        list.enabled = cfg.enabled;
        list.case_sensitive = cfg.case_sensitive;
        list.entries.insert(cfg.entries.begin(), cfg.entries.end());
        if (!cfg.file.empty()) {
            const auto from_file = AllowlistRegistry::read_entries(cfg.file);
            list.entries.insert(from_file.begin(), from_file.end());
        }
        allowlists->register_list(std::move(list));
    }
    if (!config.anonymizer.allowlist_dir.empty()) {
        allowlists->load_directory(config.anonymizer.allowlist_dir);
    }

    Anonymizer::Config anon_cfg;
    anon_cfg.language = config.anonymizer.language;
    anon_cfg.score_threshold = config.anonymizer.score_threshold;
    anon_cfg.dedup_scope = config.anonymizer.dedup_scope;
    anon_cfg.allowlist_enabled = config.anonymizer.allowlist_enabled;
    anon_cfg.intent_detection_enabled = config.anonymizer.intent_detection_enabled;
    anon_cfg.intent.question_favoring_types.clear();
    anon_cfg.intent.question_favoring_types.insert(config.anonymizer.question_favoring_types.begin(),
                                                   config.anonymizer.question_favoring_types.end());
    anon_cfg.strategies = config.anonymizer.strategies;
    for (const auto& [type, strategy] : anon_cfg.strategies) {
        utils::log::info(std::format("Strategy for {}: {}", type, strategy_to_string(strategy)));
    }
    auto anonymizer = std::make_shared<Anonymizer>(registry, allowlists, std::move(anon_cfg));

    auto deanonymizer = std::make_shared<Deanonymizer>(
        Deanonymizer::Config{config.deanonymizer.fuzzy_matching});

    std::shared_ptr<SecretInterceptor> interceptor;
    if (config.secret_scanner.enabled) {
        SecretScanner::Config scan_cfg;
        scan_cfg.enable_predefined = config.secret_scanner.enable_predefined;
        scan_cfg.max_match_length = static_cast<size_t>(config.secret_scanner.max_match_length);
        auto scanner = std::make_shared<SecretScanner>(scan_cfg);
        for (const auto& def : config.secret_scanner.patterns) {
            scanner->add_pattern(compile_secret_pattern(def));
        }

        SecretInterceptor::Config int_cfg;
        int_cfg.block_on_risk = config.secret_scanner.block_on_risk;
        interceptor = std::make_shared<SecretInterceptor>(std::move(scanner), std::move(int_cfg));
    }

    const auto ttl = std::chrono::seconds(config.store.default_ttl_seconds);
    std::shared_ptr<IMappingStore> store;
    if (config.store.backend == "redis") {
#ifdef ENABLE_REDIS
        RedisMappingStore::Config redis_cfg;
        redis_cfg.url = config.store.redis_url;
        redis_cfg.key_prefix = config.store.key_prefix;
        redis_cfg.default_ttl = ttl;
        store = std::make_shared<RedisMappingStore>(std::move(redis_cfg));
#else
        throw std::runtime_error("store.backend 'redis' requires a build with ENABLE_REDIS");
#endif
    } else {
        MemoryMappingStore::Config mem_cfg;
        mem_cfg.default_ttl = ttl;
        mem_cfg.cleanup_interval = std::chrono::seconds(config.store.cleanup_interval_seconds);
        mem_cfg.key_prefix = config.store.key_prefix;
        store = std::make_shared<MemoryMappingStore>(std::move(mem_cfg));
    }

    utils::log::info(std::format(
        "Airlock pipeline: {} recognizers, {} allowlists, secret scan {}, store {}",
        registry->size(), allowlists->size(),
        interceptor ? "on" : "off", store->backend_name()));

    return PipelineBuilder()
        .with_anonymizer(std::move(anonymizer))
        .with_deanonymizer(std::move(deanonymizer))
        .with_store(std::move(store))
        .with_interceptor(std::move(interceptor))
        .with_session_ttl(ttl)
        .build();
}

} // namespace airlock
