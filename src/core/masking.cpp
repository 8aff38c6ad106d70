#include "core/masking.hpp"
#include "core/utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <format>
#include <stdexcept>
#include <vector>

namespace airlock {

namespace {

// Byte offsets of each UTF-8 code point start, plus the end offset
std::vector<size_t> code_point_offsets(std::string_view s) {
    std::vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (size_t i = 0; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if ((c & 0xC0) != 0x80) offsets.push_back(i);
    }
    offsets.push_back(s.size());
    return offsets;
}

size_t code_point_count(std::string_view s) {
    return code_point_offsets(s).size() - 1;
}

std::string stars(size_t n) {
    return std::string(n, '*');
}

} // anonymous namespace

std::string MaskingEngine::apply(
    std::string_view value,
    std::string_view entity_type,
    AnonymizationStrategy strategy) {

    switch (strategy) {
        case AnonymizationStrategy::MASK:
            return mask_value(value, entity_type);

        case AnonymizationStrategy::REDACT:
            return std::string(kRedacted);

        case AnonymizationStrategy::HASH:
            return hash_value(value, entity_type);

        case AnonymizationStrategy::PLACEHOLDER:
            break;
    }
    throw std::invalid_argument("PLACEHOLDER is not a one-way strategy");
}

std::string MaskingEngine::mask_value(std::string_view value, std::string_view entity_type) {
    const std::string type = utils::to_upper(entity_type);

    if (type.find("PHONE") != std::string::npos) {
        return mask_phone(value);
    }
    if (type.find("EMAIL") != std::string::npos) {
        return mask_email(value);
    }
    if (type.find("ID_CARD") != std::string::npos || type.find("IDCARD") != std::string::npos) {
        return mask_digits(value, 6, 4, true);
    }
    if (type.find("CREDIT_CARD") != std::string::npos) {
        return mask_digits(value, 4, 4, false);
    }
    return mask_generic(value);
}

std::string MaskingEngine::mask_phone(std::string_view value) {
    std::string digits;
    for (const char c : value) {
        if (utils::is_ascii_digit(c)) digits += c;
    }
    if (digits.size() >= 7) {
        return std::format("{}****{}", digits.substr(0, 3), digits.substr(digits.size() - 4));
    }
    return stars(code_point_count(value));
}

std::string MaskingEngine::mask_email(std::string_view value) {
    const size_t at = value.find('@');
    if (at == std::string_view::npos) {
        return stars(code_point_count(value));
    }
    const std::string_view local = value.substr(0, at);
    const std::string_view domain = value.substr(at + 1);
    if (local.size() <= 2) {
        return std::format("{}@{}", stars(local.size()), domain);
    }
    return std::format("{}{}{}@{}", local.front(), stars(local.size() - 2), local.back(), domain);
}

std::string MaskingEngine::mask_digits(std::string_view value, size_t keep_prefix,
                                       size_t keep_suffix, bool allow_x) {
    std::string digits;
    for (const char c : value) {
        if (utils::is_ascii_digit(c) || (allow_x && (c == 'X' || c == 'x'))) digits += c;
    }
    if (digits.size() >= keep_prefix + keep_suffix) {
        return digits.substr(0, keep_prefix)
            + stars(digits.size() - keep_prefix - keep_suffix)
            + digits.substr(digits.size() - keep_suffix);
    }
    return stars(code_point_count(value));
}

std::string MaskingEngine::mask_generic(std::string_view value) {
    const auto offsets = code_point_offsets(value);
    const size_t n = offsets.size() - 1;
    if (n <= 4) {
        return stars(n);
    }

    // Keep the first and last quarter of the characters
    const size_t show = std::max<size_t>(1, n / 4);
    std::string result(value.substr(0, offsets[show]));
    result += stars(n - 2 * show);
    result.append(value.substr(offsets[n - show]));
    return result;
}

std::string MaskingEngine::hash_value(std::string_view value, std::string_view entity_type) {
    const std::string input = std::format("{}:{}", entity_type, value);

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);

    std::string result;
    result.reserve(SHA256_DIGEST_LENGTH * 2);
    for (const unsigned char b : hash) {
        result += std::format("{:02x}", b);
    }
    return result;
}

} // namespace airlock
