#include <catch2/catch_test_macros.hpp>
#include "core/deanonymizer.hpp"
#include "core/fuzzy_rehydrator.hpp"

using namespace airlock;

namespace {

SessionMapping sample_mapping() {
    SessionMapping mapping("s1");
    mapping.add("PERSON", "张三", "<PERSON_1>");
    mapping.add("PHONE", "13800138000", "<PHONE_1>");
    return mapping;
}

} // anonymous namespace

// ============================================================================
// Exact tokens
// ============================================================================

TEST_CASE("Deanonymizer restores canonical placeholders", "[deanonymizer]") {
    const auto mapping = sample_mapping();
    Deanonymizer d;

    const auto result = d.deanonymize("<PERSON_1>的电话是<PHONE_1>", mapping);
    CHECK(result.text == "张三的电话是13800138000");
    CHECK(result.replaced_count == 2);
    CHECK(result.is_complete);
    CHECK(result.unresolved.empty());
    REQUIRE(result.resolved.size() == 2);
    CHECK(result.resolved[0].normalized_form == "<PERSON_1>");
}

TEST_CASE("Deanonymizer restores repeated tokens every time", "[deanonymizer]") {
    const auto mapping = sample_mapping();
    Deanonymizer d;

    const auto result = d.deanonymize("<PERSON_1>, <PERSON_1>!", mapping);
    CHECK(result.text == "张三, 张三!");
    CHECK(result.replaced_count == 2);

    // Mapping is not consumed
    CHECK(d.deanonymize("<PERSON_1>", mapping).text == "张三");
}

TEST_CASE("Deanonymizer leaves text without tokens alone", "[deanonymizer]") {
    const auto mapping = sample_mapping();
    Deanonymizer d;

    const auto result = d.deanonymize("a < b and c > d", mapping);
    CHECK(result.text == "a < b and c > d");
    CHECK(result.replaced_count == 0);
    CHECK(result.is_complete);
}

TEST_CASE("Deanonymizer reports unknown tokens as unresolved", "[deanonymizer]") {
    const auto mapping = sample_mapping();
    Deanonymizer d;

    const auto result = d.deanonymize("<PERSON_1> met <PERSON_2> and <PERSON_2>", mapping);
    CHECK(result.text == "张三 met <PERSON_2> and <PERSON_2>");
    CHECK(result.replaced_count == 1);
    CHECK_FALSE(result.is_complete);
    CHECK(result.unresolved == std::vector<std::string>{"<PERSON_2>"});
}

// ============================================================================
// Fuzzy variants
// ============================================================================

TEST_CASE("Deanonymizer resolves reformatted tokens with fuzzy matching", "[deanonymizer][fuzzy]") {
    const auto mapping = sample_mapping();
    Deanonymizer d(Deanonymizer::Config{true});

    for (const char* variant : {"<PERSON 1>", "<person_1>", "[PERSON_1]", "{{PERSON_1}}",
                                "<PERSON-1>", "<Person:1>", "< PERSON_1 >", "{PERSON_1}"}) {
        INFO(variant);
        const auto result = d.deanonymize(std::string("你好") + variant + "！", mapping);
        CHECK(result.text == "你好张三！");
        CHECK(result.replaced_count == 1);
        CHECK(result.is_complete);
    }
}

TEST_CASE("Deanonymizer without fuzzy matching restores only exact tokens", "[deanonymizer][fuzzy]") {
    const auto mapping = sample_mapping();
    Deanonymizer d(Deanonymizer::Config{false});

    for (const char* variant : {"<PERSON 1>", "<person_1>", "[PERSON_1]", "{{PERSON_1}}", "<PERSON-1>"}) {
        INFO(variant);
        const auto result = d.deanonymize(variant, mapping);
        CHECK(result.text == variant);
        CHECK(result.replaced_count == 0);
        CHECK(result.is_complete);
    }
    CHECK(d.deanonymize("<PERSON_1>", mapping).text == "张三");
}

TEST_CASE("Deanonymizer ignores bracketed prose of unknown types", "[deanonymizer][fuzzy]") {
    const auto mapping = sample_mapping();
    Deanonymizer d;

    const auto result = d.deanonymize("See [Step 1] then [PERSON_2]", mapping);
    CHECK(result.text == "See [Step 1] then [PERSON_2]");
    CHECK(result.unresolved == std::vector<std::string>{"[PERSON_2]"});
}

TEST_CASE("Deanonymizer without a mapping reports every token", "[deanonymizer]") {
    Deanonymizer d;

    const auto result = d.deanonymize_without_mapping("x <PERSON_1> [PERSON_1] <person_1> <PERSON_1>");
    CHECK(result.text == "x <PERSON_1> [PERSON_1] <person_1> <PERSON_1>");
    CHECK(result.replaced_count == 0);
    CHECK_FALSE(result.is_complete);
    CHECK(result.unresolved == std::vector<std::string>{"<PERSON_1>", "[PERSON_1]", "<person_1>"});

    // With fuzzy matching off only canonical tokens are placeholder-like
    Deanonymizer strict(Deanonymizer::Config{false});
    const auto canonical = strict.deanonymize_without_mapping("x <PERSON_1> [PERSON_1] <person_1>");
    CHECK(canonical.unresolved == std::vector<std::string>{"<PERSON_1>"});
}

TEST_CASE("Deanonymizer extracts placeholders in first-seen order", "[deanonymizer]") {
    Deanonymizer d;

    CHECK(d.has_placeholders("x <EMAIL_1> y"));
    CHECK_FALSE(d.has_placeholders("no tokens here"));
    CHECK(d.extract_placeholders("<PHONE_1> [person_1] <PHONE_1> <EMAIL_2>") ==
          std::vector<std::string>{"<PHONE_1>", "<PERSON_1>", "<EMAIL_2>"});
}

// ============================================================================
// FuzzyRehydrator
// ============================================================================

TEST_CASE("FuzzyRehydrator finds non-overlapping tokens left to right", "[fuzzy]") {
    FuzzyRehydrator r;

    const auto matches = r.find_all("<PERSON_1>与<PERSON-2>以及[EMAIL_1]");
    REQUIRE(matches.size() == 3);
    CHECK(matches[0].match_kind == FuzzyMatchKind::EXACT);
    CHECK(matches[1].match_kind == FuzzyMatchKind::SEPARATOR);
    CHECK(matches[1].normalized_form == "<PERSON_2>");
    CHECK(matches[2].match_kind == FuzzyMatchKind::BRACKET);
    CHECK(matches[0].end <= matches[1].start);
}

TEST_CASE("FuzzyRehydrator normalize", "[fuzzy]") {
    FuzzyRehydrator fuzzy(true);
    FuzzyRehydrator strict(false);
    CHECK(fuzzy.fuzzy_enabled());
    CHECK_FALSE(strict.fuzzy_enabled());

    CHECK(fuzzy.normalize("[person-3]") == "<PERSON_3>");
    CHECK_FALSE(fuzzy.normalize("[person-3] trailing").has_value());
    CHECK_FALSE(strict.normalize("[person-3]").has_value());
    CHECK(strict.normalize("<PERSON_3>") == "<PERSON_3>");
}

TEST_CASE("FuzzyRehydrator pending_token_start", "[fuzzy]") {
    FuzzyRehydrator r;

    CHECK(r.pending_token_start("hello <PERS") == 6);
    CHECK(r.pending_token_start("hello {{") == 6);
    CHECK(r.pending_token_start("hello <PERSON_1> done") == std::string_view::npos);
    CHECK(r.pending_token_start("a < b, c") == std::string_view::npos);
    // Could still grow into "< b and c_1>"
    CHECK(r.pending_token_start("a < b and c") == 2);
    CHECK(r.pending_token_start("") == std::string_view::npos);
}
