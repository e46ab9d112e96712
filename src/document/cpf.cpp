#include "document/cpf.hpp"
#include "document/normalizer.hpp"
#include "document/patterns.hpp"
#include "core/checksum.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>

namespace brdocs::cpf {

namespace {

constexpr std::array<int, 9>  kFirstWeights  = {10, 9, 8, 7, 6, 5, 4, 3, 2};
constexpr std::array<int, 10> kSecondWeights = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};

// "00000000000" ... "99999999999" pass the checksum but are never issued
bool is_repeated_sequence(std::string_view digits) {
    return std::all_of(digits.begin(), digits.end(),
                       [first = digits.front()](char c) { return c == first; });
}

} // anonymous namespace

Result<std::string> validate(std::string_view cpf) {
    std::string cleaned = normalize(cpf);

    if (cleaned.size() != kLength) {
        return Result<std::string>::error(
            ValidationError::invalid_length(kLength, cleaned.size()));
    }

    if (!std::all_of(cleaned.begin(), cleaned.end(), utils::is_ascii_digit)) {
        return Result<std::string>::error(ValidationError::invalid_characters());
    }

    if (is_repeated_sequence(cleaned)) {
        return Result<std::string>::error(
            ValidationError::invalid_cpf("sequência de dígitos repetidos"));
    }

    if (!checksum::verify_mod11_pair(cleaned, kFirstWeights, kSecondWeights)) {
        return Result<std::string>::error(ValidationError::invalid_check_digits("CPF"));
    }

    return Result<std::string>::ok(std::move(cleaned));
}

std::string normalize(std::string_view cpf) {
    return normalizer::digits_only(cpf);
}

std::string format(std::string_view cpf) {
    const std::string cleaned = normalize(cpf);
    if (cleaned.size() != kLength) {
        return std::string(cpf);
    }

    const std::string_view d(cleaned);
    return std::format("{}.{}.{}-{}",
        d.substr(0, 3), d.substr(3, 3), d.substr(6, 3), d.substr(9, 2));
}

bool is_cpf_format(std::string_view cpf) {
    return std::regex_match(cpf.begin(), cpf.end(), patterns::cpf());
}

std::string mask(std::string_view cpf) {
    const std::string cleaned = normalize(cpf);
    if (cleaned.size() != kLength) {
        return std::string(cpf);
    }

    const std::string_view d(cleaned);
    return std::format("{}.***.***-{}", d.substr(0, 3), d.substr(9, 2));
}

} // namespace brdocs::cpf
