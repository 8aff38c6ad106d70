#include "core/pipeline.hpp"
#include "core/utils.hpp"

#include <format>
#include <functional>
#include <stdexcept>

namespace airlock {

AirlockPipeline::AirlockPipeline(PipelineComponents components)
    : c_(std::move(components)) {
    if (!c_.anonymizer || !c_.deanonymizer || !c_.store) {
        throw std::invalid_argument("AirlockPipeline requires anonymizer, deanonymizer and store");
    }
    if (c_.session_ttl.count() <= 0) {
        throw std::invalid_argument("AirlockPipeline session_ttl must be positive");
    }
}

std::mutex& AirlockPipeline::session_lock(const std::string& tenant_id,
                                          const std::string& session_id) {
    const auto h = std::hash<std::string>{}(tenant_id + '\n' + session_id);
    return session_locks_[h % kSessionLockStripes];
}

Result<AirlockPipeline::SessionScope> AirlockPipeline::resolve_scope(
    const std::string& tenant_id, const std::string& session_id, bool create_session) {

    SessionScope scope{
        tenant_id.empty() ? std::string(kDefaultTenant) : tenant_id,
        session_id,
    };
    if (!IMappingStore::is_valid_tenant_id(scope.tenant_id)) {
        return Result<SessionScope>::error(ErrorCategory::INVALID_REQUEST,
            std::format("Invalid tenant id '{}'", scope.tenant_id));
    }
    if (scope.session_id.empty()) {
        if (!create_session) {
            return Result<SessionScope>::error(ErrorCategory::INVALID_REQUEST,
                                               "Session id is required");
        }
        scope.session_id = utils::generate_uuid();
    }
    return Result<SessionScope>::ok(std::move(scope));
}

Result<std::optional<SessionMapping>> AirlockPipeline::load_mapping(const SessionScope& scope) {
    using R = Result<std::optional<SessionMapping>>;
    try {
        return R::ok(c_.store->get(scope.tenant_id, scope.session_id));
    } catch (const StoreError& e) {
        store_errors_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

std::optional<std::string> AirlockPipeline::screen(SecretInterceptor::InterceptResult check,
                                                   std::vector<SecretMatch>& warnings) {
    if (check.should_block) {
        blocked_requests_.fetch_add(1, std::memory_order_relaxed);
        return std::move(check.reason);
    }
    warnings = std::move(check.matches);
    return std::nullopt;
}

Result<std::vector<AnonymizationResult>> AirlockPipeline::anonymize_in_session(
    const SessionScope& scope,
    const std::vector<std::string_view>& texts,
    std::string_view language) {

    using R = Result<std::vector<AnonymizationResult>>;
    std::lock_guard<std::mutex> lock(session_lock(scope.tenant_id, scope.session_id));

    auto loaded = load_mapping(scope);
    if (loaded.is_error()) {
        return R::error(loaded.error_category(), loaded.error_message());
    }
    SessionMapping mapping = loaded.value() ? std::move(*loaded.value())
                                            : SessionMapping(scope.session_id);

    std::vector<AnonymizationResult> results;
    results.reserve(texts.size());
    try {
        for (const auto text : texts) {
            results.push_back(c_.anonymizer->anonymize(text, language, mapping));
        }
    } catch (const RecognitionError& e) {
        recognition_failures_.fetch_add(1, std::memory_order_relaxed);
        return R::error(ErrorCategory::RECOGNITION_ERROR, e.what());
    } catch (const std::overflow_error& e) {
        utils::log::error(std::format("Session {}: {}", scope.session_id, e.what()));
        return R::error(ErrorCategory::INTERNAL_ERROR, e.what());
    }

    if (!mapping.empty()) {
        try {
            c_.store->save(scope.tenant_id, scope.session_id, mapping, c_.session_ttl);
        } catch (const StoreError& e) {
            store_errors_.fetch_add(1, std::memory_order_relaxed);
            return R::error(ErrorCategory::STORE_ERROR, e.what());
        }
    }
    return R::ok(std::move(results));
}

Result<ProtectedRequest> AirlockPipeline::protect(const ProtectRequest& request) {
    using R = Result<ProtectedRequest>;
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    auto scope = resolve_scope(request.tenant_id, request.session_id, true);
    if (scope.is_error()) {
        return R::error(scope.error_category(), scope.error_message());
    }

    ProtectedRequest out;
    if (c_.interceptor) {
        try {
            if (auto reason = screen(c_.interceptor->check(request.text), out.secret_warnings)) {
                return R::error(ErrorCategory::SECRET_BLOCKED, std::move(*reason));
            }
        } catch (const std::exception& e) {
            utils::log::error(std::format("Secret scan failed: {}", e.what()));
            return R::error(ErrorCategory::INTERNAL_ERROR,
                            std::format("Secret scan failed: {}", e.what()));
        }
    }

    const std::string_view language = request.language
        ? std::string_view(*request.language)
        : std::string_view(c_.anonymizer->config().language);

    auto results = anonymize_in_session(scope.value(), {request.text}, language);
    if (results.is_error()) {
        return R::error(results.error_category(), results.error_message());
    }

    auto& result = results.value().front();
    out.redacted_text = std::move(result.text);
    out.counts = std::move(result.counts);
    out.session_id = scope.value().session_id;
    return R::ok(std::move(out));
}

Result<ProtectedChat> AirlockPipeline::protect_chat(const ChatProtectRequest& request) {
    using R = Result<ProtectedChat>;
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    auto scope = resolve_scope(request.tenant_id, request.session_id, true);
    if (scope.is_error()) {
        return R::error(scope.error_category(), scope.error_message());
    }

    ProtectedChat out;
    if (c_.interceptor) {
        try {
            if (auto reason = screen(c_.interceptor->check_messages(request.messages),
                                     out.secret_warnings)) {
                return R::error(ErrorCategory::SECRET_BLOCKED, std::move(*reason));
            }
        } catch (const std::exception& e) {
            utils::log::error(std::format("Secret scan failed: {}", e.what()));
            return R::error(ErrorCategory::INTERNAL_ERROR,
                            std::format("Secret scan failed: {}", e.what()));
        }
    }

    std::vector<std::string_view> contents;
    contents.reserve(request.messages.size());
    for (const auto& msg : request.messages) {
        contents.emplace_back(msg.content);
    }

    const std::string_view language = request.language
        ? std::string_view(*request.language)
        : std::string_view(c_.anonymizer->config().language);

    auto results = anonymize_in_session(scope.value(), contents, language);
    if (results.is_error()) {
        return R::error(results.error_category(), results.error_message());
    }

    out.messages.reserve(request.messages.size());
    for (size_t i = 0; i < request.messages.size(); ++i) {
        auto& result = results.value()[i];
        out.messages.push_back({request.messages[i].role, std::move(result.text)});
        for (const auto& [type, count] : result.counts) {
            out.counts[type] += count;
        }
    }
    out.session_id = scope.value().session_id;
    return R::ok(std::move(out));
}

Result<DeanonymizationResult> AirlockPipeline::restore(const std::string& tenant_id,
                                                       const std::string& session_id,
                                                       std::string_view response_text) {
    using R = Result<DeanonymizationResult>;
    total_restores_.fetch_add(1, std::memory_order_relaxed);

    auto scope = resolve_scope(tenant_id, session_id, false);
    if (scope.is_error()) {
        return R::error(scope.error_category(), scope.error_message());
    }

    auto loaded = load_mapping(scope.value());
    if (loaded.is_error()) {
        return R::error(loaded.error_category(), loaded.error_message());
    }

    if (!loaded.value()) {
        missing_mappings_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("No mapping for session {} (tenant {}); response left as is",
                                     scope.value().session_id, scope.value().tenant_id));
        return R::ok(c_.deanonymizer->deanonymize_without_mapping(response_text));
    }
    return R::ok(c_.deanonymizer->deanonymize(response_text, *loaded.value()));
}

Result<std::unique_ptr<StreamRehydrator>> AirlockPipeline::open_stream(
    const std::string& tenant_id, const std::string& session_id) {

    using R = Result<std::unique_ptr<StreamRehydrator>>;
    total_restores_.fetch_add(1, std::memory_order_relaxed);

    auto scope = resolve_scope(tenant_id, session_id, false);
    if (scope.is_error()) {
        return R::error(scope.error_category(), scope.error_message());
    }

    auto loaded = load_mapping(scope.value());
    if (loaded.is_error()) {
        return R::error(loaded.error_category(), loaded.error_message());
    }

    std::shared_ptr<const SessionMapping> mapping;
    if (loaded.value()) {
        mapping = std::make_shared<const SessionMapping>(std::move(*loaded.value()));
    } else {
        missing_mappings_.fetch_add(1, std::memory_order_relaxed);
        utils::log::info(std::format("No mapping for session {} (tenant {}); stream left as is",
                                     scope.value().session_id, scope.value().tenant_id));
    }
    return R::ok(std::make_unique<StreamRehydrator>(std::move(mapping), *c_.deanonymizer));
}

Result<bool> AirlockPipeline::end_session(const std::string& tenant_id,
                                          const std::string& session_id) {
    auto scope = resolve_scope(tenant_id, session_id, false);
    if (scope.is_error()) {
        return Result<bool>::error(scope.error_category(), scope.error_message());
    }

    std::lock_guard<std::mutex> lock(session_lock(scope.value().tenant_id, scope.value().session_id));
    try {
        return Result<bool>::ok(c_.store->remove(scope.value().tenant_id, scope.value().session_id));
    } catch (const StoreError& e) {
        store_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<bool>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

Result<size_t> AirlockPipeline::purge_tenant(const std::string& tenant_id) {
    if (!IMappingStore::is_valid_tenant_id(tenant_id)) {
        return Result<size_t>::error(ErrorCategory::INVALID_REQUEST,
                                     std::format("Invalid tenant id '{}'", tenant_id));
    }
    try {
        return Result<size_t>::ok(c_.store->delete_tenant_keys(tenant_id));
    } catch (const StoreError& e) {
        store_errors_.fetch_add(1, std::memory_order_relaxed);
        return Result<size_t>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

} // namespace airlock
