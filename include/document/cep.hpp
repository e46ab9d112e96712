#pragma once

#include "core/error.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief CEP (Código de Endereçamento Postal) - postal code
 *
 * 8 digits, no check digit. The first digit names a macro-region, the first
 * two a sub-region and the first five a sector.
 */
namespace brdocs::cep {

inline constexpr size_t kLength = 8;

/**
 * @brief Validate a CEP (with or without hyphen)
 * @return Normalized 8-digit CEP, or INVALID_LENGTH / INVALID_CHARACTERS /
 *         INVALID_CEP ("00000000")
 */
[[nodiscard]] Result<std::string> validate(std::string_view cep);

[[nodiscard]] std::string normalize(std::string_view cep);

/// 00000-000; input returned unchanged unless it holds 8 digits
[[nodiscard]] std::string format(std::string_view cep);

[[nodiscard]] bool is_cep_format(std::string_view cep);

/// 01310-***; input returned unchanged unless it holds 8 digits
[[nodiscard]] std::string mask(std::string_view cep);

/// First digit (0-9); empty when no digit is present
[[nodiscard]] std::optional<uint8_t> extract_region(std::string_view cep);

/**
 * @brief Macro-region name for the first digit
 *
 * 0 Grande São Paulo, 1 interior of São Paulo, 2 Rio de Janeiro and
 * Espírito Santo, 3 Minas Gerais, 4 Bahia and Sergipe, 5-6 Northeast and
 * North, 7 Center-West, 8 Paraná and Santa Catarina, 9 Rio Grande do Sul.
 */
[[nodiscard]] std::optional<std::string_view> get_region_name(std::string_view cep);

/// First two digits, when at least two are present
[[nodiscard]] std::optional<std::string> extract_subregion(std::string_view cep);

/// First five digits, when at least five are present
[[nodiscard]] std::optional<std::string> extract_sector(std::string_view cep);

} // namespace brdocs::cep

namespace brdocs {

[[nodiscard]] inline Result<std::string> validate_cep(std::string_view cep) { return cep::validate(cep); }
[[nodiscard]] inline std::string normalize_cep(std::string_view cep) { return cep::normalize(cep); }
[[nodiscard]] inline std::string format_cep(std::string_view cep) { return cep::format(cep); }

} // namespace brdocs
