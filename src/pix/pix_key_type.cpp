#include "pix/pix_key_type.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace brdocs {

std::string_view pix_key_type_to_string(PixKeyType type) {
    switch (type) {
        case PixKeyType::CPF:    return "CPF";
        case PixKeyType::CNPJ:   return "CNPJ";
        case PixKeyType::EMAIL:  return "E-mail";
        case PixKeyType::PHONE:  return "Telefone";
        case PixKeyType::RANDOM: return "Chave aleatória";
    }
    return "Desconhecido";
}

std::string_view pix_key_type_name(PixKeyType type) {
    switch (type) {
        case PixKeyType::CPF:    return "cpf";
        case PixKeyType::CNPJ:   return "cnpj";
        case PixKeyType::EMAIL:  return "email";
        case PixKeyType::PHONE:  return "phone";
        case PixKeyType::RANDOM: return "random";
    }
    return "unknown";
}

std::optional<PixKeyType> parse_pix_key_type(std::string_view name) {
    static const std::unordered_map<std::string, PixKeyType> lookup = {
        {"cpf",    PixKeyType::CPF},
        {"cnpj",   PixKeyType::CNPJ},
        {"email",  PixKeyType::EMAIL},
        {"phone",  PixKeyType::PHONE},
        {"random", PixKeyType::RANDOM},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

} // namespace brdocs
