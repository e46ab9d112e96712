#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

/**
 * @brief CPF (Cadastro de Pessoas Físicas) - individual taxpayer ID
 *
 * 11 digits, the last two being modulo-11 check digits.
 */
namespace brdocs::cpf {

inline constexpr size_t kLength = 11;

/**
 * @brief Validate a CPF (punctuated or not)
 * @return Normalized 11-digit CPF, or INVALID_LENGTH / INVALID_CHARACTERS /
 *         INVALID_CPF (repeated digits) / INVALID_CHECK_DIGITS
 */
[[nodiscard]] Result<std::string> validate(std::string_view cpf);

/// Remove every non-digit character
[[nodiscard]] std::string normalize(std::string_view cpf);

/// 000.000.000-00; input returned unchanged unless it holds 11 digits
[[nodiscard]] std::string format(std::string_view cpf);

/// Shape check only, no check digits
[[nodiscard]] bool is_cpf_format(std::string_view cpf);

/// 123.***.***-09; input returned unchanged unless it holds 11 digits
[[nodiscard]] std::string mask(std::string_view cpf);

} // namespace brdocs::cpf

namespace brdocs {

[[nodiscard]] inline Result<std::string> validate_cpf(std::string_view cpf) { return cpf::validate(cpf); }
[[nodiscard]] inline std::string normalize_cpf(std::string_view cpf) { return cpf::normalize(cpf); }
[[nodiscard]] inline std::string format_cpf(std::string_view cpf) { return cpf::format(cpf); }

} // namespace brdocs
