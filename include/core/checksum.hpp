#pragma once

#include <span>
#include <string_view>

namespace brdocs::checksum {

/**
 * @brief Weighted modulo-11 check digit
 *
 * Accumulates digits[i] * weights[i] for i in [0, weights.size()) and
 * derives the digit: 0 when sum % 11 < 2, otherwise 11 - (sum % 11).
 *
 * @param digits Digit-only string, at least weights.size() long
 * @param weights Weight sequence; its size is the digit window
 * @return Check digit 0-9, or -1 if the window is out of range or contains
 *         a non-digit
 */
[[nodiscard]] int mod11_check_digit(std::string_view digits, std::span<const int> weights);

/**
 * @brief Verify a two-check-digit document
 *
 * The first digit is computed over the first `first.size()` digits and
 * compared with digits[first.size()]; the second likewise with `second`.
 */
[[nodiscard]] bool verify_mod11_pair(std::string_view digits,
                                     std::span<const int> first,
                                     std::span<const int> second);

} // namespace brdocs::checksum
