#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "core/pipeline_builder.hpp"
#include "core/placeholder_allocator.hpp"
#include "core/session_mapping.hpp"
#include "storage/memory_mapping_store.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace airlock;
using namespace std::chrono_literals;

namespace {

// Stateless dictionary port, safe to call from many threads
class DictionaryPort : public EntityRecognitionPort {
public:
    explicit DictionaryPort(std::vector<std::string> names) : names_(std::move(names)) {}

    std::vector<DetectedSpan> detect(std::string_view text, std::string_view) override {
        std::vector<DetectedSpan> out;
        for (const auto& name : names_) {
            for (auto pos = text.find(name); pos != std::string_view::npos;
                 pos = text.find(name, pos + name.size())) {
                out.emplace_back("PERSON", pos, pos + name.size(), 0.9);
            }
        }
        return out;
    }

private:
    const std::vector<std::string> names_;
};

} // namespace

// ============================================================================
// Allocation
// ============================================================================

TEST_CASE("PlaceholderAllocator hands out each index once across threads", "[concurrency]") {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    PlaceholderAllocator allocator;
    std::vector<std::vector<uint32_t>> seen(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            seen[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                seen[t].push_back(allocator.next("PERSON"));
            }
        });
    }
    for (auto& t : threads) t.join();

    std::set<uint32_t> all;
    for (const auto& indices : seen) {
        // Each thread observes its own indices in increasing order
        CHECK(std::is_sorted(indices.begin(), indices.end()));
        all.insert(indices.begin(), indices.end());
    }
    CHECK(all.size() == kThreads * kPerThread);
    CHECK(*all.begin() == 1);
    CHECK(*all.rbegin() == kThreads * kPerThread);
    CHECK(allocator.current("PERSON") == kThreads * kPerThread);
}

TEST_CASE("SessionMapping get_or_allocate is consistent across threads", "[concurrency]") {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    constexpr int kOriginals = 300;

    SessionMapping mapping("s1");
    std::vector<std::unordered_map<std::string, std::string>> seen(kThreads);
    std::atomic<int> conflicts{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; ++i) {
                const auto original = std::format("user{}", (i * 7 + t) % kOriginals);
                auto token = mapping.get_or_allocate("PERSON", original);
                auto [it, inserted] = seen[t].emplace(original, token);
                if (!inserted && it->second != token) {
                    conflicts.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& t : threads) t.join();

    CHECK(conflicts.load() == 0);
    CHECK(mapping.size() == kOriginals);
    CHECK(mapping.current_index("PERSON") == kOriginals);

    std::set<std::string> tokens;
    for (int i = 0; i < kOriginals; ++i) {
        const auto token = mapping.get_placeholder("PERSON", std::format("user{}", i));
        REQUIRE(token.has_value());
        tokens.insert(*token);
    }
    CHECK(tokens.size() == kOriginals);
    CHECK(tokens.contains("<PERSON_1>"));
    CHECK(tokens.contains(std::format("<PERSON_{}>", kOriginals)));

    // Every thread saw the token that ended up in the mapping
    for (const auto& per_thread : seen) {
        for (const auto& [original, token] : per_thread) {
            CHECK(mapping.get_placeholder("PERSON", original) == token);
        }
    }
}

// ============================================================================
// Store against its sweep thread
// ============================================================================

TEST_CASE("MemoryMappingStore readers and writers race the sweep", "[concurrency][store]") {
    constexpr int kThreads = 4;
    constexpr int kIterations = 500;

    MemoryMappingStore::Config cfg;
    cfg.default_ttl = 60s;
    cfg.cleanup_interval = 1ms;
    MemoryMappingStore store(cfg);

    SessionMapping sample("sample");
    (void)sample.get_or_allocate("PERSON", "张三");

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            const auto keep = std::format("keep-{}", t);
            store.save("acme", keep, sample);
            for (int i = 0; i < kIterations; ++i) {
                const auto session = std::format("s{}-{}", t, i % 16);
                store.save("acme", session, sample);
                if (!store.get("acme", session).has_value()) failures.fetch_add(1);
                if (!store.extend_ttl("acme", session)) failures.fetch_add(1);
                // Short-lived entries for the sweep to evict
                store.save("acme", std::format("short-{}-{}", t, i), sample, 1s);
                if (i % 3 == 0 && !store.remove("acme", session)) failures.fetch_add(1);
                if (!store.exists("acme", keep)) failures.fetch_add(1);
            }
        });
    }
    for (auto& t : threads) t.join();
    std::this_thread::sleep_for(20ms);

    CHECK(failures.load() == 0);
    for (int t = 0; t < kThreads; ++t) {
        CHECK(store.exists("acme", std::format("keep-{}", t)));
    }
    CHECK(store.get_stats().sweeps > 0);

    store.shutdown();
}

// ============================================================================
// Pipeline session serialization
// ============================================================================

TEST_CASE("Pipeline serializes concurrent protect calls on one session", "[concurrency][pipeline]") {
    constexpr int kThreads = 8;
    constexpr int kIterations = 20;

    std::vector<std::string> names;
    for (int t = 0; t < kThreads; ++t) {
        names.push_back(std::format("员工{}", t));
    }
    names.push_back("张三");

    MemoryMappingStore::Config store_cfg;
    store_cfg.start_cleanup_thread = false;
    auto store = std::make_shared<MemoryMappingStore>(store_cfg);

    auto pipeline = PipelineBuilder()
        .with_anonymizer(std::make_shared<Anonymizer>(
            std::make_shared<DictionaryPort>(names), nullptr, Anonymizer::Config{}))
        .with_deanonymizer(std::make_shared<Deanonymizer>())
        .with_store(store)
        .build();

    // Token each thread received for its own name, one entry per call
    std::vector<std::vector<std::string>> own_tokens(kThreads);
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i) {
                auto result = pipeline->protect({"acme", "shared", names[t] + "和张三开会", std::nullopt});
                if (result.is_error()) {
                    errors.fetch_add(1);
                    continue;
                }
                const auto& text = result.value().redacted_text;
                own_tokens[t].push_back(text.substr(0, text.find("和")));
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(errors.load() == 0);

    const auto stored = store->get("acme", "shared");
    REQUIRE(stored.has_value());
    CHECK(stored->size() == names.size());
    CHECK(stored->current_index("PERSON") == names.size());

    std::set<std::string> distinct;
    for (int t = 0; t < kThreads; ++t) {
        const auto expected = stored->get_placeholder("PERSON", names[t]);
        REQUIRE(expected.has_value());
        distinct.insert(*expected);
        for (const auto& token : own_tokens[t]) {
            CHECK(token == *expected);
        }
    }
    CHECK(distinct.size() == kThreads);

    auto restored = pipeline->restore("acme", "shared", own_tokens[3].front() + " / " + own_tokens[5].front());
    REQUIRE(restored.is_ok());
    CHECK(restored.value().text == names[3] + " / " + names[5]);
}
