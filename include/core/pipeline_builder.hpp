#pragma once

#include <chrono>
#include <memory>

namespace airlock {

// Forward declarations
class Anonymizer;
class Deanonymizer;
class IMappingStore;
class SecretInterceptor;
class AirlockPipeline;
struct AirlockConfig;

/**
 * @brief All components that AirlockPipeline needs, grouped in a single struct.
 */
struct PipelineComponents {
    // Required
    std::shared_ptr<Anonymizer> anonymizer;
    std::shared_ptr<Deanonymizer> deanonymizer;
    std::shared_ptr<IMappingStore> store;

    // Optional (nullptr = no secret pre-check)
    std::shared_ptr<SecretInterceptor> interceptor;

    // Lifetime of a session mapping after each protect() call
    std::chrono::seconds session_ttl{300};
};

/**
 * @brief Builder pattern for AirlockPipeline construction.
 *
 * Usage:
 *   auto pipeline = PipelineBuilder()
 *       .with_anonymizer(anonymizer)
 *       .with_deanonymizer(deanonymizer)
 *       .with_store(store)
 *       .with_interceptor(interceptor)  // optional
 *       .build();
 */
class PipelineBuilder {
public:
    PipelineBuilder& with_anonymizer(std::shared_ptr<Anonymizer> p)            { c_.anonymizer = std::move(p); return *this; }
    PipelineBuilder& with_deanonymizer(std::shared_ptr<Deanonymizer> p)        { c_.deanonymizer = std::move(p); return *this; }
    PipelineBuilder& with_store(std::shared_ptr<IMappingStore> p)              { c_.store = std::move(p); return *this; }
    PipelineBuilder& with_interceptor(std::shared_ptr<SecretInterceptor> p)    { c_.interceptor = std::move(p); return *this; }
    PipelineBuilder& with_session_ttl(std::chrono::seconds ttl)                { c_.session_ttl = ttl; return *this; }

    /**
     * @brief Build the pipeline from accumulated components.
     * @throws std::runtime_error if required components are missing.
     */
    [[nodiscard]] std::shared_ptr<AirlockPipeline> build();

    /**
     * @brief Wire every component described by a loaded config
     *
     * Builds the recognizer registry (built-ins plus [[patterns]]), the
     * allowlists, the secret scanner and the configured store backend.
     * @throws std::runtime_error if a component cannot be created
     *         (unreadable allowlist file, redis backend not compiled in)
     */
    [[nodiscard]] static std::shared_ptr<AirlockPipeline> from_config(const AirlockConfig& config);

private:
    PipelineComponents c_;
};

} // namespace airlock
