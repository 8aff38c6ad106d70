#include <catch2/catch_test_macros.hpp>
#include "core/placeholder.hpp"
#include "core/placeholder_allocator.hpp"

#include <stdexcept>

using namespace airlock;

// ============================================================================
// Canonical form
// ============================================================================

TEST_CASE("Placeholder make produces canonical token", "[placeholder]") {
    CHECK(placeholder::make("PERSON", 1) == "<PERSON_1>");
    CHECK(placeholder::make("CREDIT_CARD", 12) == "<CREDIT_CARD_12>");
}

TEST_CASE("Placeholder parse_canonical accepts only the exact form", "[placeholder]") {
    auto parsed = placeholder::parse_canonical("<CREDIT_CARD_12>");
    REQUIRE(parsed.has_value());
    CHECK(parsed->first == "CREDIT_CARD");
    CHECK(parsed->second == 12);

    CHECK_FALSE(placeholder::parse_canonical("<PERSON_01>").has_value());
    CHECK_FALSE(placeholder::parse_canonical("<PERSON_0>").has_value());
    CHECK_FALSE(placeholder::parse_canonical("<person_1>").has_value());
    CHECK_FALSE(placeholder::parse_canonical("[PERSON_1]").has_value());
    CHECK_FALSE(placeholder::parse_canonical("<PERSON-1>").has_value());
    CHECK_FALSE(placeholder::parse_canonical("<PERSON_1").has_value());
    CHECK_FALSE(placeholder::parse_canonical("<PERSON_1>x").has_value());
    CHECK_FALSE(placeholder::parse_canonical("").has_value());
}

TEST_CASE("Placeholder entity type validation", "[placeholder]") {
    CHECK(placeholder::is_valid_entity_type("PERSON"));
    CHECK(placeholder::is_valid_entity_type("CREDIT_CARD"));
    CHECK_FALSE(placeholder::is_valid_entity_type(""));
    CHECK_FALSE(placeholder::is_valid_entity_type("person"));
    CHECK_FALSE(placeholder::is_valid_entity_type("_PERSON"));
    CHECK_FALSE(placeholder::is_valid_entity_type("PERSON_"));
    CHECK_FALSE(placeholder::is_valid_entity_type("CREDIT__CARD"));
    CHECK_FALSE(placeholder::is_valid_entity_type("PHONE2"));
    CHECK_FALSE(placeholder::is_valid_entity_type(std::string(33, 'A')));
}

TEST_CASE("Placeholder normalize_entity_type", "[placeholder]") {
    CHECK(placeholder::normalize_entity_type("credit-card") == "CREDIT_CARD");
    CHECK(placeholder::normalize_entity_type("phone number") == "PHONE_NUMBER");
    CHECK(placeholder::normalize_entity_type("Person") == "PERSON");
    CHECK_FALSE(placeholder::normalize_entity_type("PHONE2").has_value());
    CHECK_FALSE(placeholder::normalize_entity_type("").has_value());
}

TEST_CASE("Placeholder maximum length covers the widest variant", "[placeholder]") {
    CHECK(placeholder::kMaxPlaceholderLength == 52);

    const std::string widest = "{{  " + std::string(32, 'A') + " - 999999999  }}";
    CHECK(widest.size() == placeholder::kMaxPlaceholderLength);
    const auto r = placeholder::scan_at(widest, 0);
    REQUIRE(r.status == placeholder::ScanStatus::MATCH);
    CHECK(r.match.end == widest.size());
}

// ============================================================================
// scan_at
// ============================================================================

TEST_CASE("Placeholder scan classifies variants", "[placeholder]") {
    using placeholder::scan_at;
    using placeholder::ScanStatus;

    struct Case {
        const char* token;
        FuzzyMatchKind kind;
    };
    const Case cases[] = {
        {"<PERSON_1>", FuzzyMatchKind::EXACT},
        {"<person_1>", FuzzyMatchKind::CASE},
        {"<Person_1>", FuzzyMatchKind::CASE},
        {"<PERSON-1>", FuzzyMatchKind::SEPARATOR},
        {"<PERSON 1>", FuzzyMatchKind::SEPARATOR},
        {"<PERSON:1>", FuzzyMatchKind::SEPARATOR},
        {"<PERSON : 1>", FuzzyMatchKind::SEPARATOR},
        {"< PERSON_1 >", FuzzyMatchKind::SEPARATOR},
        {"[PERSON_1]", FuzzyMatchKind::BRACKET},
        {"{PERSON_1}", FuzzyMatchKind::BRACKET},
        {"{{PERSON_1}}", FuzzyMatchKind::BRACKET},
    };

    for (const auto& c : cases) {
        INFO(c.token);
        const std::string token = c.token;
        const auto r = scan_at(token, 0);
        REQUIRE(r.status == ScanStatus::MATCH);
        CHECK(r.match.end == token.size());
        CHECK(r.match.raw_span == token);
        CHECK(r.match.normalized_form == "<PERSON_1>");
        CHECK(r.match.resolved_type == "PERSON");
        CHECK(r.match.resolved_index == 1);
        CHECK(r.match.match_kind == c.kind);
    }
}

TEST_CASE("Placeholder scan handles multi-word types", "[placeholder]") {
    const auto r = placeholder::scan_at("<credit-card-3>", 0);
    REQUIRE(r.status == placeholder::ScanStatus::MATCH);
    CHECK(r.match.normalized_form == "<CREDIT_CARD_3>");

    const auto colon = placeholder::scan_at("<CREDIT_CARD:3>", 0);
    REQUIRE(colon.status == placeholder::ScanStatus::MATCH);
    CHECK(colon.match.normalized_form == "<CREDIT_CARD_3>");

    // ':' separates the index only
    CHECK(placeholder::scan_at("<CREDIT:CARD_3>", 0).status == placeholder::ScanStatus::NO_MATCH);
}

TEST_CASE("Placeholder scan reports PARTIAL only at the end of input", "[placeholder]") {
    using placeholder::ScanStatus;

    CHECK(placeholder::scan_at("<", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("{", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("<PERS", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("<PERSON_", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("<PERSON_1", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("{{PERSON_1}", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("text <PERSON_1", 5).status == ScanStatus::PARTIAL);

    CHECK(placeholder::scan_at("<PERSON_1 and more", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("<3", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("< b", 0).status == ScanStatus::PARTIAL);
    CHECK(placeholder::scan_at("a < b and c > d", 2).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("plain", 0).status == ScanStatus::NO_MATCH);
}

TEST_CASE("Placeholder scan rejects malformed indices", "[placeholder]") {
    using placeholder::ScanStatus;

    CHECK(placeholder::scan_at("<PERSON_0>", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("<PERSON_01>", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("<PERSON_1234567890>", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("<PERSON>", 0).status == ScanStatus::NO_MATCH);
    CHECK(placeholder::scan_at("<PERSON_1]", 0).status == ScanStatus::NO_MATCH);
}

// ============================================================================
// PlaceholderAllocator
// ============================================================================

TEST_CASE("PlaceholderAllocator counts per type from 1", "[placeholder][allocator]") {
    PlaceholderAllocator alloc;
    CHECK(alloc.current("PERSON") == 0);
    CHECK(alloc.next("PERSON") == 1);
    CHECK(alloc.next("PERSON") == 2);
    CHECK(alloc.next("PHONE") == 1);
    CHECK(alloc.current("PERSON") == 2);
}

TEST_CASE("PlaceholderAllocator observe never lowers a counter", "[placeholder][allocator]") {
    PlaceholderAllocator alloc;
    alloc.observe("PERSON", 5);
    CHECK(alloc.next("PERSON") == 6);
    alloc.observe("PERSON", 2);
    CHECK(alloc.next("PERSON") == 7);

    alloc.reset();
    CHECK(alloc.current("PERSON") == 0);
    CHECK(alloc.snapshot().empty());
}

TEST_CASE("PlaceholderAllocator refuses to exceed the index space", "[placeholder][allocator]") {
    PlaceholderAllocator alloc;
    alloc.observe("PERSON", placeholder::kMaxIndex);
    CHECK_THROWS_AS(alloc.next("PERSON"), std::overflow_error);
    CHECK(alloc.next("PHONE") == 1);
}
