#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief CNPJ (Cadastro Nacional da Pessoa Jurídica) - business taxpayer ID
 *
 * 14 digits: 8-digit company base, 4-digit branch, 2 weighted modulo-11
 * check digits.
 */
namespace brdocs::cnpj {

inline constexpr size_t kLength = 14;
inline constexpr std::string_view kMainBranch = "0001";

/**
 * @brief Validate a CNPJ (punctuated or not)
 * @return Normalized 14-digit CNPJ, or INVALID_LENGTH / INVALID_CHARACTERS /
 *         INVALID_CNPJ (repeated digits) / INVALID_CHECK_DIGITS
 */
[[nodiscard]] Result<std::string> validate(std::string_view cnpj);

[[nodiscard]] std::string normalize(std::string_view cnpj);

/// 00.000.000/0000-00; input returned unchanged unless it holds 14 digits
[[nodiscard]] std::string format(std::string_view cnpj);

[[nodiscard]] bool is_cnpj_format(std::string_view cnpj);

/// 11.***.***/**01-81
[[nodiscard]] std::string mask(std::string_view cnpj);

/// Company identifier (first 8 digits)
[[nodiscard]] std::optional<std::string> extract_base(std::string_view cnpj);

/// Branch number (digits 9-12)
[[nodiscard]] std::optional<std::string> extract_branch(std::string_view cnpj);

[[nodiscard]] bool is_main_branch(std::string_view cnpj);

} // namespace brdocs::cnpj

namespace brdocs {

[[nodiscard]] inline Result<std::string> validate_cnpj(std::string_view cnpj) { return cnpj::validate(cnpj); }
[[nodiscard]] inline std::string normalize_cnpj(std::string_view cnpj) { return cnpj::normalize(cnpj); }
[[nodiscard]] inline std::string format_cnpj(std::string_view cnpj) { return cnpj::format(cnpj); }

} // namespace brdocs
