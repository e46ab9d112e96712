#include "document/cep.hpp"
#include "document/normalizer.hpp"
#include "document/patterns.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <regex>

namespace brdocs::cep {

namespace {

constexpr std::array<std::string_view, 10> kRegionNames = {
    "Grande São Paulo",
    "Interior de São Paulo",
    "Rio de Janeiro e Espírito Santo",
    "Minas Gerais",
    "Bahia e Sergipe",
    "Pernambuco, Alagoas, Paraíba e Rio Grande do Norte",
    "Ceará, Piauí, Maranhão, Pará, Amazonas, Acre, Amapá e Roraima",
    "Distrito Federal, Goiás, Tocantins, Mato Grosso, Mato Grosso do Sul e Rondônia",
    "Paraná e Santa Catarina",
    "Rio Grande do Sul",
};

constexpr std::string_view kUnknownRegion = "Região desconhecida";

} // anonymous namespace

Result<std::string> validate(std::string_view cep) {
    std::string cleaned = normalize(cep);

    if (cleaned.size() != kLength) {
        return Result<std::string>::error(
            ValidationError::invalid_length(kLength, cleaned.size()));
    }

    if (!std::all_of(cleaned.begin(), cleaned.end(), utils::is_ascii_digit)) {
        return Result<std::string>::error(ValidationError::invalid_characters());
    }

    if (cleaned == "00000000") {
        return Result<std::string>::error(ValidationError::invalid_cep("CEP inválido"));
    }

    return Result<std::string>::ok(std::move(cleaned));
}

std::string normalize(std::string_view cep) {
    return normalizer::digits_only(cep);
}

std::string format(std::string_view cep) {
    const std::string cleaned = normalize(cep);
    if (cleaned.size() != kLength) {
        return std::string(cep);
    }
    return std::format("{}-{}", cleaned.substr(0, 5), cleaned.substr(5, 3));
}

bool is_cep_format(std::string_view cep) {
    return std::regex_match(cep.begin(), cep.end(), patterns::cep());
}

std::string mask(std::string_view cep) {
    const std::string cleaned = normalize(cep);
    if (cleaned.size() != kLength) {
        return std::string(cep);
    }
    return std::format("{}-***", cleaned.substr(0, 5));
}

std::optional<uint8_t> extract_region(std::string_view cep) {
    const std::string cleaned = normalize(cep);
    if (cleaned.empty()) {
        return std::nullopt;
    }
    return static_cast<uint8_t>(cleaned.front() - '0');
}

std::optional<std::string_view> get_region_name(std::string_view cep) {
    const auto region = extract_region(cep);
    if (!region) {
        return std::nullopt;
    }
    if (*region >= kRegionNames.size()) {
        return kUnknownRegion;
    }
    return kRegionNames[*region];
}

std::optional<std::string> extract_subregion(std::string_view cep) {
    const std::string cleaned = normalize(cep);
    if (cleaned.size() < 2) {
        return std::nullopt;
    }
    return cleaned.substr(0, 2);
}

std::optional<std::string> extract_sector(std::string_view cep) {
    const std::string cleaned = normalize(cep);
    if (cleaned.size() < 5) {
        return std::nullopt;
    }
    return cleaned.substr(0, 5);
}

} // namespace brdocs::cep
