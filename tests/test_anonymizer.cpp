#include <catch2/catch_test_macros.hpp>
#include "core/anonymizer.hpp"
#include "core/error.hpp"
#include "core/masking.hpp"
#include "mocks/mock_recognizer.hpp"

#include <memory>
#include <stdexcept>

using namespace airlock;
using airlock::test::MockRecognitionPort;

namespace {

Anonymizer make_anonymizer(std::shared_ptr<MockRecognitionPort> port,
                           Anonymizer::Config config = {},
                           std::shared_ptr<const AllowlistRegistry> allowlist = nullptr) {
    return Anonymizer(std::move(port), std::move(allowlist), std::move(config));
}

} // anonymous namespace

// ============================================================================
// Basic replacement
// ============================================================================

TEST_CASE("Anonymizer replaces spans with placeholders", "[anonymizer]") {
    const std::string text = "张三的电话是13800138000";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON");
    port->add_span(text, "13800138000", "PHONE");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping("s1");
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "<PERSON_1>的电话是<PHONE_1>");
    CHECK(result.counts.at("PERSON") == 1);
    CHECK(result.counts.at("PHONE") == 1);
    REQUIRE(result.entities.size() == 2);
    CHECK(result.entities[0].text == "张三");
    CHECK(result.entities[1].text == "13800138000");

    CHECK(mapping.get_original("<PERSON_1>") == "张三");
    CHECK(mapping.get_original("<PHONE_1>") == "13800138000");
    CHECK(port->last_language == "zh");
}

TEST_CASE("Anonymizer numbers by first appearance, not detection order", "[anonymizer]") {
    const std::string text = "李四和张三";
    auto port = std::make_shared<MockRecognitionPort>();
    // Reported out of order
    port->add_span(text, "张三", "PERSON");
    port->add_span(text, "李四", "PERSON");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping;
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "<PERSON_1>和<PERSON_2>");
    CHECK(mapping.get_original("<PERSON_1>") == "李四");
}

TEST_CASE("Anonymizer reuses placeholders for repeated values", "[anonymizer]") {
    const std::string text = "张三说张三很忙";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_all(text, "张三", "PERSON");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping;
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "<PERSON_1>说<PERSON_1>很忙");
    CHECK(result.counts.at("PERSON") == 2);
    CHECK(mapping.size() == 1);
}

TEST_CASE("Anonymizer keeps numbering across calls in a session", "[anonymizer]") {
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_term("张三", "PERSON");
    port->add_term("李四", "PERSON");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    CHECK(anon.anonymize("张三来了", mapping).text == "<PERSON_1>来了");
    CHECK(anon.anonymize("李四和张三", mapping).text == "<PERSON_2>和<PERSON_1>");
}

TEST_CASE("Anonymizer leaves text without entities unchanged", "[anonymizer]") {
    auto port = std::make_shared<MockRecognitionPort>();
    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    const auto result = anon.anonymize("今天天气不错", mapping);
    CHECK(result.text == "今天天气不错");
    CHECK(result.counts.empty());
    CHECK(mapping.empty());
}

TEST_CASE("Anonymizer skips recognition for blank input", "[anonymizer]") {
    auto port = std::make_shared<MockRecognitionPort>();
    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    CHECK(anon.anonymize("", mapping).text.empty());
    CHECK(anon.anonymize("  \n\t", mapping).text == "  \n\t");
    CHECK(port->calls.load() == 0);
}

// ============================================================================
// Filtering
// ============================================================================

TEST_CASE("Anonymizer drops spans below the score threshold", "[anonymizer]") {
    const std::string text = "张三在北京";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON", 0.9);
    port->add_span(text, "北京", "LOCATION", 0.3);

    Anonymizer::Config cfg;
    cfg.score_threshold = 0.5;
    const auto anon = make_anonymizer(port, cfg);
    SessionMapping mapping;

    CHECK(anon.anonymize(text, mapping).text == "<PERSON_1>在北京");
}

TEST_CASE("Anonymizer resolves overlaps by score then length", "[anonymizer]") {
    SECTION("higher score wins") {
        std::vector<DetectedSpan> spans = {
            {"PHONE", 0, 11, 0.7},
            {"CREDIT_CARD", 0, 16, 0.6},
        };
        const auto kept = Anonymizer::resolve_overlaps(spans);
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "PHONE");
    }

    SECTION("longer span wins on equal score") {
        std::vector<DetectedSpan> spans = {
            {"LOCATION", 0, 6, 0.8},
            {"ORG", 0, 12, 0.8},
        };
        const auto kept = Anonymizer::resolve_overlaps(spans);
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "ORG");
    }

    SECTION("earlier span wins on equal score and length") {
        std::vector<DetectedSpan> spans = {
            {"B", 3, 8, 0.8},
            {"A", 0, 5, 0.8},
        };
        const auto kept = Anonymizer::resolve_overlaps(spans);
        REQUIRE(kept.size() == 1);
        CHECK(kept[0].entity_type == "A");
    }

    SECTION("disjoint spans are all kept in text order") {
        std::vector<DetectedSpan> spans = {
            {"B", 10, 12, 0.6},
            {"A", 0, 5, 0.9},
            {"C", 5, 10, 0.7},
        };
        const auto kept = Anonymizer::resolve_overlaps(spans);
        REQUIRE(kept.size() == 3);
        CHECK(kept[0].entity_type == "A");
        CHECK(kept[1].entity_type == "C");
        CHECK(kept[2].entity_type == "B");
    }
}

TEST_CASE("Anonymizer normalizes and aliases entity types", "[anonymizer]") {
    const std::string text = "call 13800138000 or mail a@b.com";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "13800138000", "phone_number");
    port->add_span(text, "a@b.com", "EMAIL_ADDRESS");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping;
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "call <PHONE_1> or mail <EMAIL_1>");
}

// ============================================================================
// Fail closed
// ============================================================================

TEST_CASE("Anonymizer fails closed when recognition fails", "[anonymizer]") {
    const std::string text = "张三的电话";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON");
    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    SECTION("RecognitionError propagates") {
        port->failure = MockRecognitionPort::Failure::RECOGNITION_ERROR;
        CHECK_THROWS_AS(anon.anonymize(text, mapping), RecognitionError);
    }

    SECTION("other exceptions become RecognitionError") {
        port->failure = MockRecognitionPort::Failure::RUNTIME_ERROR;
        CHECK_THROWS_AS(anon.anonymize(text, mapping), RecognitionError);
    }

    CHECK(mapping.empty());
    CHECK(anon.get_stats().recognition_failures == 1);
}

TEST_CASE("Anonymizer rejects malformed spans", "[anonymizer]") {
    const std::string text = "张三的电话";
    auto port = std::make_shared<MockRecognitionPort>();
    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    SECTION("end past the text") {
        port->spans.emplace_back("PERSON", 0, text.size() + 1, 0.9);
    }
    SECTION("empty span") {
        port->spans.emplace_back("PERSON", 3, 3, 0.9);
    }
    SECTION("inside a UTF-8 sequence") {
        port->spans.emplace_back("PERSON", 1, 6, 0.9);
    }
    SECTION("unusable type name") {
        port->spans.emplace_back("PERSON2", 0, 6, 0.9);
    }

    CHECK_THROWS_AS(anon.anonymize(text, mapping), RecognitionError);
    CHECK(mapping.empty());
}

TEST_CASE("Anonymizer requires a recognition port", "[anonymizer]") {
    CHECK_THROWS_AS(Anonymizer(nullptr, nullptr, Anonymizer::Config{}), std::invalid_argument);
}

// ============================================================================
// Allowlist
// ============================================================================

TEST_CASE("Anonymizer leaves allowlisted values in place", "[anonymizer][allowlist]") {
    const std::string text = "马云和张三开会";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "马云", "PERSON");
    port->add_span(text, "张三", "PERSON");

    auto allowlist = std::make_shared<AllowlistRegistry>();
    Allowlist list;
    list.name = "public_figures";
    list.entity_type = "PERSON";
    list.entries = {"马云"};
    allowlist->register_list(std::move(list));

    SECTION("exempt when enabled") {
        const auto anon = make_anonymizer(port, {}, allowlist);
        SessionMapping mapping;
        const auto result = anon.anonymize(text, mapping);

        CHECK(result.text == "马云和<PERSON_1>开会");
        REQUIRE(result.exemptions.size() == 1);
        CHECK(result.exemptions[0].entity_type == "PERSON");
        CHECK(result.exemptions[0].start == 0);
        CHECK_FALSE(mapping.get_placeholder("PERSON", "马云").has_value());
        CHECK(anon.get_stats().total_exemptions == 1);
    }

    SECTION("ignored when disabled in config") {
        Anonymizer::Config cfg;
        cfg.allowlist_enabled = false;
        const auto anon = make_anonymizer(port, cfg, allowlist);
        SessionMapping mapping;

        CHECK(anon.anonymize(text, mapping).text == "<PERSON_1>和<PERSON_2>开会");
    }
}

TEST_CASE("Anonymizer keeps entities asked about in question context", "[anonymizer][intent]") {
    const std::string text = "请问张三的电话13800138000是多少？";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON");
    port->add_span(text, "13800138000", "PHONE");

    SECTION("enabled by default") {
        const auto anon = make_anonymizer(port);
        SessionMapping mapping;
        const auto result = anon.anonymize(text, mapping);

        CHECK(result.text == "请问张三的电话<PHONE_1>是多少？");
        REQUIRE(result.intent_exemptions.size() == 1);
        CHECK(result.intent_exemptions[0].entity_type == "PERSON");
        CHECK(result.intent_exemptions[0].start == 6);
        CHECK(result.intent_exemptions[0].reason == "whole text is a question");
        CHECK(result.exemptions.empty());
        CHECK_FALSE(mapping.get_placeholder("PERSON", "张三").has_value());
        CHECK(anon.get_stats().total_intent_exemptions == 1);
    }

    SECTION("off when disabled in config") {
        Anonymizer::Config cfg;
        cfg.intent_detection_enabled = false;
        const auto anon = make_anonymizer(port, cfg);
        SessionMapping mapping;
        const auto result = anon.anonymize(text, mapping);

        CHECK(result.text == "请问<PERSON_1>的电话<PHONE_1>是多少？");
        CHECK(result.intent_exemptions.empty());
    }
}

TEST_CASE("Anonymizer redacts entities used in statements", "[anonymizer][intent]") {
    const std::string text = "明天给张三打电话";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON");

    const auto anon = make_anonymizer(port);
    SessionMapping mapping;
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "明天给<PERSON_1>打电话");
    CHECK(result.intent_exemptions.empty());
}

TEST_CASE("Anonymizer checks intent before the allowlist", "[anonymizer][intent][allowlist]") {
    const std::string text = "马云是谁";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "马云", "PERSON");

    auto allowlist = std::make_shared<AllowlistRegistry>();
    Allowlist list;
    list.name = "public_figures";
    list.entity_type = "PERSON";
    list.entries = {"马云"};
    allowlist->register_list(std::move(list));

    const auto anon = make_anonymizer(port, {}, allowlist);
    SessionMapping mapping;
    const auto result = anon.anonymize(text, mapping);

    CHECK(result.text == "马云是谁");
    CHECK(result.intent_exemptions.size() == 1);
    CHECK(result.exemptions.empty());
}

// ============================================================================
// Strategies and dedup scope
// ============================================================================

TEST_CASE("Anonymizer applies one-way strategies per type", "[anonymizer][strategy]") {
    const std::string text = "张三 13800138000 6222020200112233440";
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_span(text, "张三", "PERSON");
    port->add_span(text, "13800138000", "PHONE");
    port->add_span(text, "6222020200112233440", "CREDIT_CARD");

    Anonymizer::Config cfg;
    cfg.strategies["PHONE"] = AnonymizationStrategy::MASK;
    cfg.strategies["CREDIT_CARD"] = AnonymizationStrategy::REDACT;
    const auto anon = make_anonymizer(port, cfg);
    SessionMapping mapping;

    const auto result = anon.anonymize(text, mapping);
    CHECK(result.text == "<PERSON_1> 138****8000 [REDACTED]");
    CHECK(result.counts.at("PHONE") == 1);

    // One-way replacements never enter the mapping
    CHECK(mapping.size() == 1);
    CHECK(anon.strategy_for("PHONE") == AnonymizationStrategy::MASK);
    CHECK(anon.strategy_for("PERSON") == AnonymizationStrategy::PLACEHOLDER);
}

TEST_CASE("Anonymizer HASH strategy is deterministic", "[anonymizer][strategy]") {
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_term("a@b.com", "EMAIL");

    Anonymizer::Config cfg;
    cfg.strategies["EMAIL"] = AnonymizationStrategy::HASH;
    const auto anon = make_anonymizer(port, cfg);
    SessionMapping mapping;

    const auto result = anon.anonymize("mail a@b.com", mapping);
    CHECK(result.text == "mail " + MaskingEngine::hash_value("a@b.com", "EMAIL"));
    CHECK(mapping.empty());
}

TEST_CASE("Anonymizer CALL scope allocates fresh tokens per call", "[anonymizer][scope]") {
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_term("张三", "PERSON");

    Anonymizer::Config cfg;
    cfg.dedup_scope = DedupScope::CALL;
    const auto anon = make_anonymizer(port, cfg);
    SessionMapping mapping;

    // Repeats within one call share a token
    CHECK(anon.anonymize("张三和张三", mapping).text == "<PERSON_1>和<PERSON_1>");
    // A new call gets a new token, the old one keeps resolving
    CHECK(anon.anonymize("张三", mapping).text == "<PERSON_2>");
    CHECK(mapping.get_original("<PERSON_1>") == "张三");
    CHECK(mapping.get_original("<PERSON_2>") == "张三");
}

TEST_CASE("Anonymizer stats count calls and entities", "[anonymizer]") {
    auto port = std::make_shared<MockRecognitionPort>();
    port->add_term("张三", "PERSON");
    const auto anon = make_anonymizer(port);
    SessionMapping mapping;

    (void)anon.anonymize("张三", mapping);
    (void)anon.anonymize("张三和张三", mapping);

    const auto stats = anon.get_stats();
    CHECK(stats.total_calls == 2);
    CHECK(stats.total_entities == 3);
    CHECK(stats.recognition_failures == 0);
}
