#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "core/utils.hpp"
#include "security/secret_interceptor.hpp"
#include "storage/memory_mapping_store.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

using namespace airlock;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitBlocked = 2;
constexpr int kExitInterrupted = 130;

constexpr const char* kDefaultConfigPath = "config/airlock.toml";

// Global instances for signal handling
std::shared_ptr<AirlockPipeline> g_pipeline;
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    g_interrupted.store(true, std::memory_order_release);

    if (g_pipeline) {
        if (auto* memory = dynamic_cast<MemoryMappingStore*>(&g_pipeline->store())) {
            memory->shutdown();
        }
    }
}

void print_usage(const char* program) {
    std::cerr << std::format(
        "Usage: {} [--config path] [--tenant id] [--session id] <command>\n"
        "\n"
        "Commands (input is read from stdin):\n"
        "  scan       report secrets; exit 2 if the content would be blocked\n"
        "  sanitize   replace secrets with [REDACTED:<pattern>]\n"
        "  anonymize  print the redacted text, then the session mapping as JSON\n"
        "  roundtrip  anonymize, store, and restore through the configured store\n",
        program);
}

struct CliOptions {
    std::string config_path;
    bool config_explicit = false;
    std::string tenant_id;
    std::string session_id;
    std::string command;
};

bool parse_args(int argc, char* argv[], CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

        if (arg == "--config" || arg == "--tenant" || arg == "--session") {
            const char* value = next();
            if (!value) {
                std::cerr << std::format("Missing value for {}\n", arg);
                return false;
            }
            if (arg == "--config") {
                opts.config_path = value;
                opts.config_explicit = true;
            } else if (arg == "--tenant") {
                opts.tenant_id = value;
            } else {
                opts.session_id = value;
            }
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            std::cerr << std::format("Unexpected argument '{}'\n", arg);
            return false;
        }
    }
    return opts.command == "scan" || opts.command == "sanitize"
        || opts.command == "anonymize" || opts.command == "roundtrip";
}

std::string read_stdin() {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
}

int report_error(ErrorCategory category, const std::string& message) {
    if (category == ErrorCategory::SECRET_BLOCKED) {
        std::cerr << std::format("Blocked: {}\n", message);
        return kExitBlocked;
    }
    utils::log::error(std::format("{}: {}", error_category_to_string(category), message));
    return kExitError;
}

int run_scan(const SecretInterceptor& interceptor, const std::string& input) {
    const auto result = interceptor.check(input);
    for (const auto& m : result.matches) {
        std::cout << std::format("line {}: {} ({}) {}\n",
                                 m.line_number, m.pattern_name,
                                 risk_level_to_string(m.risk_level), m.redacted());
    }
    if (result.should_block) {
        std::cerr << std::format("Blocked: {}\n", result.reason);
        return kExitBlocked;
    }
    std::cerr << std::format("{} secret(s) found, none blocking\n", result.matches.size());
    return kExitOk;
}

int run_anonymize(AirlockPipeline& pipeline, const CliOptions& opts, const std::string& input) {
    auto protected_req = pipeline.protect({opts.tenant_id, opts.session_id, input, std::nullopt});
    if (protected_req.is_error()) {
        return report_error(protected_req.error_category(), protected_req.error_message());
    }
    const auto& out = protected_req.value();
    std::cout << out.redacted_text << "\n";

    const auto tenant = opts.tenant_id.empty() ? std::string(kDefaultTenant) : opts.tenant_id;
    try {
        const auto mapping = pipeline.store().get(tenant, out.session_id);
        std::cout << (mapping ? mapping->to_portable().dump(2)
                              : SessionMapping(out.session_id).to_portable().dump(2))
                  << "\n";
    } catch (const StoreError& e) {
        return report_error(ErrorCategory::STORE_ERROR, e.what());
    }
    return kExitOk;
}

int run_roundtrip(AirlockPipeline& pipeline, const CliOptions& opts, const std::string& input) {
    auto protected_req = pipeline.protect({opts.tenant_id, opts.session_id, input, std::nullopt});
    if (protected_req.is_error()) {
        return report_error(protected_req.error_category(), protected_req.error_message());
    }
    const auto& out = protected_req.value();
    utils::log::info(std::format("Session {}: {} entity type(s) replaced",
                                 out.session_id, out.counts.size()));

    if (g_interrupted.load(std::memory_order_acquire)) return kExitInterrupted;

    auto restored = pipeline.restore(opts.tenant_id, out.session_id, out.redacted_text);
    if (restored.is_error()) {
        return report_error(restored.error_category(), restored.error_message());
    }
    const auto& r = restored.value();
    std::cout << r.text;
    if (!r.text.empty() && r.text.back() != '\n') std::cout << "\n";

    for (const auto& m : r.resolved) {
        if (m.match_kind != FuzzyMatchKind::EXACT) {
            utils::log::info(std::format("Restored {} variant '{}'",
                                         match_kind_to_string(m.match_kind), m.raw_span));
        }
    }
    if (!r.is_complete) {
        utils::log::warn(std::format("{} placeholder(s) unresolved", r.unresolved.size()));
    }
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return kExitError;
    }

    try {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // [1/3] Configuration
        AirlockConfig config;
        const std::string config_path = opts.config_explicit ? opts.config_path : kDefaultConfigPath;
        if (opts.config_explicit || std::filesystem::exists(config_path)) {
            utils::log::info(std::format("[1/3] Loading configuration from {}", config_path));
            auto config_result = ConfigLoader::load_from_file(config_path);
            if (!config_result.success) {
                return report_error(ErrorCategory::CONFIG_ERROR, config_result.error_message);
            }
            config = std::move(config_result.config);
        } else {
            utils::log::info("[1/3] No config file - using built-in defaults");
        }

        if (!utils::log::set_level(config.logging.level)) {
            utils::log::warn(std::format("Unknown log level '{}'", config.logging.level));
        }

        // [2/3] Components
        utils::log::info("[2/3] Building airlock pipeline");
        g_pipeline = PipelineBuilder::from_config(config);

        // [3/3] Command
        utils::log::info(std::format("[3/3] Running '{}'", opts.command));
        const std::string input = read_stdin();
        if (g_interrupted.load(std::memory_order_acquire)) return kExitInterrupted;

        int rc = kExitOk;
        if (opts.command == "scan" || opts.command == "sanitize") {
            // scanning works even when the pre-check is disabled for requests
            const auto fallback = std::make_shared<SecretInterceptor>();
            const SecretInterceptor& interceptor =
                g_pipeline->interceptor() ? *g_pipeline->interceptor() : *fallback;

            if (opts.command == "scan") {
                rc = run_scan(interceptor, input);
            } else {
                std::cout << interceptor.sanitize(input);
            }
        } else if (opts.command == "anonymize") {
            rc = run_anonymize(*g_pipeline, opts, input);
        } else {
            rc = run_roundtrip(*g_pipeline, opts, input);
        }

        if (auto* memory = dynamic_cast<MemoryMappingStore*>(&g_pipeline->store())) {
            memory->shutdown();
        }
        return rc;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return kExitError;
    }
}
