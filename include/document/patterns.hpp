#pragma once

#include <regex>

namespace brdocs::patterns {

// Structural recognizers. Each regex is compiled once on first use and shared
// read-only afterwards; std::regex matching on a const object is safe from
// any number of threads.

/// 000.000.000-00 with optional punctuation
[[nodiscard]] const std::regex& cpf();

/// 00.000.000/0000-00 with optional punctuation
[[nodiscard]] const std::regex& cnpj();

/// 00000-000 with optional hyphen
[[nodiscard]] const std::regex& cep();

/// +55 11 98765-4321, (11) 98765-4321, 1134567890, ...
[[nodiscard]] const std::regex& phone();

[[nodiscard]] const std::regex& email();

/// PIX phone key: +55 followed by exactly 11 digits
[[nodiscard]] const std::regex& pix_phone();

/// Lowercase 8-4-4-4-12 hex token
[[nodiscard]] const std::regex& random_key();

} // namespace brdocs::patterns
