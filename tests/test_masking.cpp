#include <catch2/catch_test_macros.hpp>
#include "core/masking.hpp"

#include <stdexcept>

using namespace airlock;

// ============================================================================
// MaskingEngine::mask_value tests
// ============================================================================

TEST_CASE("Masking phone keeps prefix and last four digits", "[masking]") {
    CHECK(MaskingEngine::mask_value("13800138000", "PHONE") == "138****8000");
    CHECK(MaskingEngine::mask_value("138-0013-8000", "PHONE") == "138****8000");
    CHECK(MaskingEngine::mask_value("13800138000", "phone_number") == "138****8000");
}

TEST_CASE("Masking phone falls back to stars for short values", "[masking]") {
    CHECK(MaskingEngine::mask_value("12345", "PHONE") == "*****");
}

TEST_CASE("Masking email keeps first and last local character", "[masking]") {
    CHECK(MaskingEngine::mask_value("zhangsan@example.com", "EMAIL") == "z******n@example.com");
    CHECK(MaskingEngine::mask_value("ab@x.com", "EMAIL") == "**@x.com");
    CHECK(MaskingEngine::mask_value("noatsign", "EMAIL") == "********");
}

TEST_CASE("Masking ID card keeps region code and check digits", "[masking]") {
    CHECK(MaskingEngine::mask_value("11010519491231002X", "ID_CARD") == "110105********002X");
}

TEST_CASE("Masking credit card keeps first and last four digits", "[masking]") {
    CHECK(MaskingEngine::mask_value("6222020200112233440", "CREDIT_CARD") == "6222***********3440");
    CHECK(MaskingEngine::mask_value("4111 1111 1111 1111", "CREDIT_CARD") == "4111********1111");
}

TEST_CASE("Masking generic values counts characters, not bytes", "[masking]") {
    CHECK(MaskingEngine::mask_value("张三丰", "PERSON") == "***");
    CHECK(MaskingEngine::mask_value("abcdefgh", "ORG") == "ab****gh");
    CHECK(MaskingEngine::mask_value("欧阳中华人民", "ORG") == "欧****民");
    CHECK(MaskingEngine::mask_value("", "ORG").empty());
}

// ============================================================================
// MaskingEngine::apply tests
// ============================================================================

TEST_CASE("Masking REDACT replaces entire value", "[masking]") {
    CHECK(MaskingEngine::apply("zhangsan@example.com", "EMAIL", AnonymizationStrategy::REDACT) == "[REDACTED]");
    CHECK(MaskingEngine::apply("", "PERSON", AnonymizationStrategy::REDACT) == "[REDACTED]");
}

TEST_CASE("Masking MASK dispatches on entity type", "[masking]") {
    CHECK(MaskingEngine::apply("13800138000", "PHONE", AnonymizationStrategy::MASK) == "138****8000");
}

TEST_CASE("Masking HASH produces deterministic 64-hex output", "[masking]") {
    auto hash1 = MaskingEngine::apply("test@example.com", "EMAIL", AnonymizationStrategy::HASH);
    auto hash2 = MaskingEngine::apply("test@example.com", "EMAIL", AnonymizationStrategy::HASH);

    CHECK(hash1 == hash2);  // Deterministic
    CHECK(hash1.size() == 64);

    for (char c : hash1) {
        CHECK(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
    }

    // Different inputs produce different hashes
    CHECK(hash1 != MaskingEngine::apply("other@example.com", "EMAIL", AnonymizationStrategy::HASH));
    // The type is part of the digest
    CHECK(hash1 != MaskingEngine::apply("test@example.com", "PERSON", AnonymizationStrategy::HASH));
}

TEST_CASE("Masking rejects PLACEHOLDER", "[masking]") {
    CHECK_THROWS_AS(MaskingEngine::apply("张三", "PERSON", AnonymizationStrategy::PLACEHOLDER),
                    std::invalid_argument);
}
