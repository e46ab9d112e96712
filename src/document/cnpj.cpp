#include "document/cnpj.hpp"
#include "document/normalizer.hpp"
#include "document/patterns.hpp"
#include "core/checksum.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>

namespace brdocs::cnpj {

namespace {

constexpr std::array<int, 12> kFirstWeights  = {5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};
constexpr std::array<int, 13> kSecondWeights = {6, 5, 4, 3, 2, 9, 8, 7, 6, 5, 4, 3, 2};

bool is_repeated_sequence(std::string_view digits) {
    return std::all_of(digits.begin(), digits.end(),
                       [first = digits.front()](char c) { return c == first; });
}

} // anonymous namespace

Result<std::string> validate(std::string_view cnpj) {
    std::string cleaned = normalize(cnpj);

    if (cleaned.size() != kLength) {
        return Result<std::string>::error(
            ValidationError::invalid_length(kLength, cleaned.size()));
    }

    if (!std::all_of(cleaned.begin(), cleaned.end(), utils::is_ascii_digit)) {
        return Result<std::string>::error(ValidationError::invalid_characters());
    }

    if (is_repeated_sequence(cleaned)) {
        return Result<std::string>::error(
            ValidationError::invalid_cnpj("sequência de dígitos repetidos"));
    }

    if (!checksum::verify_mod11_pair(cleaned, kFirstWeights, kSecondWeights)) {
        return Result<std::string>::error(ValidationError::invalid_check_digits("CNPJ"));
    }

    return Result<std::string>::ok(std::move(cleaned));
}

std::string normalize(std::string_view cnpj) {
    return normalizer::digits_only(cnpj);
}

std::string format(std::string_view cnpj) {
    const std::string cleaned = normalize(cnpj);
    if (cleaned.size() != kLength) {
        return std::string(cnpj);
    }

    const std::string_view d(cleaned);
    return std::format("{}.{}.{}/{}-{}",
        d.substr(0, 2), d.substr(2, 3), d.substr(5, 3), d.substr(8, 4), d.substr(12, 2));
}

bool is_cnpj_format(std::string_view cnpj) {
    return std::regex_match(cnpj.begin(), cnpj.end(), patterns::cnpj());
}

std::string mask(std::string_view cnpj) {
    const std::string cleaned = normalize(cnpj);
    if (cleaned.size() != kLength) {
        return std::string(cnpj);
    }

    const std::string_view d(cleaned);
    return std::format("{}.***.***/**{}-{}", d.substr(0, 2), d.substr(10, 2), d.substr(12, 2));
}

std::optional<std::string> extract_base(std::string_view cnpj) {
    const std::string cleaned = normalize(cnpj);
    if (cleaned.size() != kLength) {
        return std::nullopt;
    }
    return cleaned.substr(0, 8);
}

std::optional<std::string> extract_branch(std::string_view cnpj) {
    const std::string cleaned = normalize(cnpj);
    if (cleaned.size() != kLength) {
        return std::nullopt;
    }
    return cleaned.substr(8, 4);
}

bool is_main_branch(std::string_view cnpj) {
    const auto branch = extract_branch(cnpj);
    return branch.has_value() && *branch == kMainBranch;
}

} // namespace brdocs::cnpj
