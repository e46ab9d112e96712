#include "document/phone.hpp"
#include "document/normalizer.hpp"
#include "document/patterns.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>
#include <unordered_map>

namespace brdocs::phone {

namespace {

constexpr std::array<std::string_view, 67> kValidDdds = {
    // São Paulo
    "11", "12", "13", "14", "15", "16", "17", "18", "19",
    // Rio de Janeiro e Espírito Santo
    "21", "22", "24", "27", "28",
    // Minas Gerais
    "31", "32", "33", "34", "35", "37", "38",
    // Paraná
    "41", "42", "43", "44", "45", "46",
    // Santa Catarina
    "47", "48", "49",
    // Rio Grande do Sul
    "51", "53", "54", "55",
    // Centro-Oeste, Acre e Rondônia
    "61", "62", "63", "64", "65", "66", "67", "68", "69",
    // Bahia e Sergipe
    "71", "73", "74", "75", "77", "79",
    // Nordeste
    "81", "82", "83", "84", "85", "86", "87", "88", "89",
    // Norte, Maranhão
    "91", "92", "93", "94", "95", "96", "97", "98", "99",
};

/**
 * @brief Strip the country code from a normalized number
 *
 * "+55..." always loses its prefix; a bare "55" only when what is left would
 * still be longer than a mobile number.
 */
std::string_view national_number(std::string_view cleaned) {
    if (cleaned.starts_with(kCountryCode)) {
        return cleaned.substr(kCountryCode.size());
    }
    if (cleaned.starts_with("55") && cleaned.size() > kMobileLength) {
        return cleaned.substr(2);
    }
    return cleaned;
}

bool has_country_code(std::string_view cleaned) {
    return cleaned.starts_with(kCountryCode) ||
           (cleaned.starts_with("55") && cleaned.size() > kMobileLength);
}

} // anonymous namespace

Result<std::string> validate(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    const std::string_view number = national_number(cleaned);

    if (number.size() < kLandlineLength || number.size() > kMobileLength) {
        return Result<std::string>::error(
            ValidationError::invalid_length(kLandlineLength, number.size()));
    }

    const std::string_view ddd = number.substr(0, 2);
    if (!is_valid_ddd(ddd)) {
        return Result<std::string>::error(
            ValidationError::invalid_phone(std::format("DDD {} inválido", ddd)));
    }

    if (number.size() == kMobileLength && number[2] != '9') {
        return Result<std::string>::error(
            ValidationError::invalid_phone("celular deve começar com 9"));
    }

    return Result<std::string>::ok(std::format("{}{}", kCountryCode, number));
}

std::string normalize(std::string_view phone) {
    return normalizer::digits_with_plus(phone);
}

std::string format(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    const std::string_view prefix = has_country_code(cleaned) ? "+55 " : "";
    const std::string_view number = national_number(cleaned);

    switch (number.size()) {
        case kMobileLength:
            return std::format("{}({}) {}-{}",
                prefix, number.substr(0, 2), number.substr(2, 5), number.substr(7, 4));
        case kLandlineLength:
            return std::format("{}({}) {}-{}",
                prefix, number.substr(0, 2), number.substr(2, 4), number.substr(6, 4));
        default:
            return std::string(phone);
    }
}

bool is_phone_format(std::string_view phone) {
    return std::regex_match(phone.begin(), phone.end(), patterns::phone());
}

bool is_mobile(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    const std::string_view number = national_number(cleaned);
    return number.size() == kMobileLength && number[2] == '9';
}

bool is_landline(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    return national_number(cleaned).size() == kLandlineLength;
}

std::optional<std::string> extract_ddd(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    const std::string_view number = national_number(cleaned);
    if (number.size() < 2) {
        return std::nullopt;
    }
    return std::string(number.substr(0, 2));
}

bool is_valid_ddd(std::string_view ddd) {
    return std::find(kValidDdds.begin(), kValidDdds.end(), ddd) != kValidDdds.end();
}

std::optional<std::string_view> get_state_for_ddd(std::string_view ddd) {
    static const std::unordered_map<std::string_view, std::string_view> lookup = {
        // São Paulo
        {"11", "São Paulo (Capital e Grande SP)"},
        {"12", "São Paulo (Vale do Paraíba)"},
        {"13", "São Paulo (Baixada Santista)"},
        {"14", "São Paulo (Bauru)"},
        {"15", "São Paulo (Sorocaba)"},
        {"16", "São Paulo (Ribeirão Preto)"},
        {"17", "São Paulo (São José do Rio Preto)"},
        {"18", "São Paulo (Presidente Prudente)"},
        {"19", "São Paulo (Campinas)"},
        // Rio de Janeiro / Espírito Santo
        {"21", "Rio de Janeiro (Capital e Região)"},
        {"22", "Rio de Janeiro (Interior)"},
        {"24", "Rio de Janeiro (Petrópolis)"},
        {"27", "Espírito Santo"},
        {"28", "Espírito Santo"},
        // Minas Gerais
        {"31", "Minas Gerais (BH e Região)"},
        {"32", "Minas Gerais"}, {"33", "Minas Gerais"}, {"34", "Minas Gerais"},
        {"35", "Minas Gerais"}, {"37", "Minas Gerais"}, {"38", "Minas Gerais"},
        // Paraná / Santa Catarina
        {"41", "Paraná (Curitiba e Região)"},
        {"42", "Paraná"}, {"43", "Paraná"}, {"44", "Paraná"}, {"45", "Paraná"}, {"46", "Paraná"},
        {"47", "Santa Catarina"}, {"48", "Santa Catarina"}, {"49", "Santa Catarina"},
        // Rio Grande do Sul
        {"51", "Rio Grande do Sul (Porto Alegre)"},
        {"53", "Rio Grande do Sul"}, {"54", "Rio Grande do Sul"}, {"55", "Rio Grande do Sul"},
        // Centro-Oeste
        {"61", "Distrito Federal"},
        {"62", "Goiás (Goiânia)"},
        {"63", "Tocantins"},
        {"64", "Goiás"},
        {"65", "Mato Grosso"}, {"66", "Mato Grosso"},
        {"67", "Mato Grosso do Sul"},
        // Norte
        {"68", "Acre"},
        {"69", "Rondônia"},
        {"91", "Pará"}, {"93", "Pará"}, {"94", "Pará"},
        {"92", "Amazonas"}, {"97", "Amazonas"},
        {"95", "Roraima"},
        {"96", "Amapá"},
        // Nordeste
        {"71", "Bahia (Salvador)"},
        {"73", "Bahia"}, {"74", "Bahia"}, {"75", "Bahia"}, {"77", "Bahia"},
        {"79", "Sergipe"},
        {"81", "Pernambuco (Recife)"},
        {"82", "Alagoas"},
        {"83", "Paraíba"},
        {"84", "Rio Grande do Norte"},
        {"85", "Ceará"}, {"88", "Ceará"},
        {"86", "Piauí"}, {"89", "Piauí"},
        {"87", "Pernambuco"},
        {"98", "Maranhão"}, {"99", "Maranhão"},
    };

    const auto it = lookup.find(ddd);
    if (it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::string mask(std::string_view phone) {
    const std::string cleaned = normalize(phone);
    const std::string_view number = national_number(cleaned);

    switch (number.size()) {
        case kMobileLength:
            return std::format("({}) *****-{}", number.substr(0, 2), number.substr(7, 4));
        case kLandlineLength:
            return std::format("({}) ****-{}", number.substr(0, 2), number.substr(6, 4));
        default:
            return std::string(phone);
    }
}

} // namespace brdocs::phone
