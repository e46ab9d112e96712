#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace brdocs {

/**
 * @brief PIX key types, declared in dispatch precedence order
 */
enum class PixKeyType {
    CPF,
    CNPJ,
    EMAIL,
    PHONE,
    RANDOM
};

/// Display name: "CPF", "CNPJ", "E-mail", "Telefone", "Chave aleatória"
[[nodiscard]] std::string_view pix_key_type_to_string(PixKeyType type);

/// Config name: "cpf", "cnpj", "email", "phone", "random"
[[nodiscard]] std::string_view pix_key_type_name(PixKeyType type);

/// Parse a config name (case-insensitive)
[[nodiscard]] std::optional<PixKeyType> parse_pix_key_type(std::string_view name);

/**
 * @brief A recognized key and its canonical value
 */
struct PixKeyClassification {
    PixKeyType type;
    std::string value;
};

} // namespace brdocs
