#pragma once

#include <ostream>
#include <span>
#include <string_view>

namespace brdocs::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitInvalid = 1;
inline constexpr int kExitUsage = 2;

/**
 * @brief Run one brdocs command
 *
 *   [--config FILE] <validate|format|mask|normalize|check> <cpf|cnpj|cep|phone|pix> <value>
 *   [--config FILE] detect <value>
 *
 * @param args Command-line arguments without the program name
 * @param out Results, and the JSON error body for invalid input
 * @param err Usage text
 * @return kExitOk, kExitInvalid (invalid input or failed shape check) or
 *         kExitUsage (bad arguments or unusable config)
 */
[[nodiscard]] int run(std::span<const std::string_view> args, std::ostream& out, std::ostream& err);

} // namespace brdocs::cli
