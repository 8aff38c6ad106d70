#pragma once

#include "core/anonymizer.hpp"
#include "core/deanonymizer.hpp"
#include "core/error.hpp"
#include "core/pipeline_builder.hpp"
#include "core/stream_rehydrator.hpp"
#include "core/types.hpp"
#include "security/secret_interceptor.hpp"
#include "storage/mapping_store.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace airlock {

struct ProtectRequest {
    std::string tenant_id;          // empty = "default"
    std::string session_id;         // empty = start a new session
    std::string text;
    std::optional<std::string> language;
};

struct ProtectedRequest {
    std::string redacted_text;
    std::string session_id;
    std::map<std::string, size_t> counts;
    std::vector<SecretMatch> secret_warnings;   // matched but below the block threshold
};

struct ChatProtectRequest {
    std::string tenant_id;
    std::string session_id;
    std::vector<ChatMessage> messages;
    std::optional<std::string> language;
};

struct ProtectedChat {
    std::vector<ChatMessage> messages;          // contents redacted, roles untouched
    std::string session_id;
    std::map<std::string, size_t> counts;
    std::vector<SecretMatch> secret_warnings;   // message_index set, offsets into that message
};

/**
 * @brief Request/response coordinator around the airlock components
 *
 * protect():
 * 1. Secret pre-check (blocked requests never reach recognition)
 * 2. Load the session mapping, or start a new one
 * 3. Anonymize (fail closed on recognition errors)
 * 4. Save the mapping with the session TTL
 *
 * restore(): load the mapping and deanonymize. A missing or expired
 * mapping is not an error: the text comes back unchanged and every
 * placeholder-like token is reported unresolved.
 *
 * Calls for the same (tenant, session) are serialized inside one process.
 */
class AirlockPipeline {
public:
    explicit AirlockPipeline(PipelineComponents components);

    [[nodiscard]] Result<ProtectedRequest> protect(const ProtectRequest& request);

    /**
     * @brief Protect a whole chat transcript with one shared mapping
     */
    [[nodiscard]] Result<ProtectedChat> protect_chat(const ChatProtectRequest& request);

    [[nodiscard]] Result<DeanonymizationResult> restore(const std::string& tenant_id,
                                                        const std::string& session_id,
                                                        std::string_view response_text);

    /**
     * @brief Incremental restore for a streamed response
     *
     * The rehydrator borrows this pipeline's deanonymizer and must not
     * outlive it.
     */
    [[nodiscard]] Result<std::unique_ptr<StreamRehydrator>> open_stream(const std::string& tenant_id,
                                                                        const std::string& session_id);

    /**
     * @brief Drop a session's mapping (conversation finished)
     */
    [[nodiscard]] Result<bool> end_session(const std::string& tenant_id,
                                           const std::string& session_id);

    /**
     * @brief Drop every session of a tenant
     */
    [[nodiscard]] Result<size_t> purge_tenant(const std::string& tenant_id);

    [[nodiscard]] const Anonymizer& anonymizer() const { return *c_.anonymizer; }
    [[nodiscard]] const Deanonymizer& deanonymizer() const { return *c_.deanonymizer; }
    [[nodiscard]] IMappingStore& store() const { return *c_.store; }
    [[nodiscard]] const SecretInterceptor* interceptor() const { return c_.interceptor.get(); }

    struct Stats {
        uint64_t total_requests;
        uint64_t blocked_requests;
        uint64_t recognition_failures;
        uint64_t store_errors;
        uint64_t total_restores;
        uint64_t missing_mappings;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .total_requests = total_requests_.load(std::memory_order_relaxed),
            .blocked_requests = blocked_requests_.load(std::memory_order_relaxed),
            .recognition_failures = recognition_failures_.load(std::memory_order_relaxed),
            .store_errors = store_errors_.load(std::memory_order_relaxed),
            .total_restores = total_restores_.load(std::memory_order_relaxed),
            .missing_mappings = missing_mappings_.load(std::memory_order_relaxed),
        };
    }

private:
    static constexpr size_t kSessionLockStripes = 64;

    [[nodiscard]] std::mutex& session_lock(const std::string& tenant_id,
                                           const std::string& session_id);

    struct SessionScope {
        std::string tenant_id;
        std::string session_id;
    };

    // Applies the tenant default and validates ids; create_session fills an empty session id
    [[nodiscard]] static Result<SessionScope> resolve_scope(const std::string& tenant_id,
                                                            const std::string& session_id,
                                                            bool create_session);

    // Loads the session's mapping; absent mappings yield std::nullopt
    [[nodiscard]] Result<std::optional<SessionMapping>> load_mapping(const SessionScope& scope);

    // Anonymizes each text in order against one session mapping, then saves it
    [[nodiscard]] Result<std::vector<AnonymizationResult>> anonymize_in_session(
        const SessionScope& scope,
        const std::vector<std::string_view>& texts,
        std::string_view language);

    // Records the block and returns its reason; non-blocking matches go to warnings
    [[nodiscard]] std::optional<std::string> screen(SecretInterceptor::InterceptResult check,
                                                    std::vector<SecretMatch>& warnings);

    PipelineComponents c_;
    std::array<std::mutex, kSessionLockStripes> session_locks_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> blocked_requests_{0};
    std::atomic<uint64_t> recognition_failures_{0};
    std::atomic<uint64_t> store_errors_{0};
    std::atomic<uint64_t> total_restores_{0};
    std::atomic<uint64_t> missing_mappings_{0};
};

} // namespace airlock
