#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Brazilian phone numbers
 *
 * National-significant numbers are a 2-digit area code (DDD) followed by
 * 8 digits (landline) or 9 digits starting with 9 (mobile). An optional
 * +55 / 55 country code may precede them.
 */
namespace brdocs::phone {

inline constexpr size_t kLandlineLength = 10;
inline constexpr size_t kMobileLength = 11;
inline constexpr std::string_view kCountryCode = "+55";

/**
 * @brief Validate a phone number in any common layout
 * @return "+55" followed by the national number, or INVALID_LENGTH /
 *         INVALID_PHONE (unknown DDD, 11-digit number without leading 9)
 */
[[nodiscard]] Result<std::string> validate(std::string_view phone);

/// Keep digits and a leading '+'
[[nodiscard]] std::string normalize(std::string_view phone);

/// "+55 (11) 98765-4321", "(11) 3456-7890"; unchanged for other lengths
[[nodiscard]] std::string format(std::string_view phone);

[[nodiscard]] bool is_phone_format(std::string_view phone);

/// 11-digit national number whose third digit is 9
[[nodiscard]] bool is_mobile(std::string_view phone);

/// 10-digit national number
[[nodiscard]] bool is_landline(std::string_view phone);

/// Area code: first two digits of the national number
[[nodiscard]] std::optional<std::string> extract_ddd(std::string_view phone);

[[nodiscard]] bool is_valid_ddd(std::string_view ddd);

/// Human-readable state (and region) served by a DDD
[[nodiscard]] std::optional<std::string_view> get_state_for_ddd(std::string_view ddd);

/// "(11) *****-4321" / "(11) ****-7890"; unchanged for other lengths
[[nodiscard]] std::string mask(std::string_view phone);

} // namespace brdocs::phone

namespace brdocs {

[[nodiscard]] inline Result<std::string> validate_phone(std::string_view phone) { return phone::validate(phone); }
[[nodiscard]] inline std::string normalize_phone(std::string_view phone) { return phone::normalize(phone); }
[[nodiscard]] inline std::string format_phone(std::string_view phone) { return phone::format(phone); }

} // namespace brdocs
