#include "pix/pix_key_kinds.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/patterns.hpp"
#include "core/utils.hpp"

#include <format>
#include <regex>

namespace brdocs {

namespace {

constexpr std::string_view kRandomKeyMaskTail = "****-****-****-****-****";

bool regex_matches(std::string_view key, const std::regex& re) {
    return std::regex_match(key.begin(), key.end(), re);
}

} // anonymous namespace

// ============================================================================
// CPF
// ============================================================================

bool CpfKeyKind::matches(std::string_view key) const {
    return cpf::is_cpf_format(key);
}

Result<std::string> CpfKeyKind::validate(std::string_view key) const {
    return cpf::validate(key);
}

std::string CpfKeyKind::normalize(std::string_view key) const {
    return cpf::normalize(key);
}

std::string CpfKeyKind::mask(std::string_view key) const {
    return cpf::mask(key);
}

// ============================================================================
// CNPJ
// ============================================================================

bool CnpjKeyKind::matches(std::string_view key) const {
    return cnpj::is_cnpj_format(key);
}

Result<std::string> CnpjKeyKind::validate(std::string_view key) const {
    return cnpj::validate(key);
}

std::string CnpjKeyKind::normalize(std::string_view key) const {
    return cnpj::normalize(key);
}

std::string CnpjKeyKind::mask(std::string_view key) const {
    return cnpj::mask(key);
}

// ============================================================================
// Email
// ============================================================================

bool EmailKeyKind::matches(std::string_view key) const {
    return regex_matches(key, patterns::email());
}

Result<std::string> EmailKeyKind::validate(std::string_view key) const {
    return Result<std::string>::ok(normalize(key));
}

std::string EmailKeyKind::normalize(std::string_view key) const {
    return utils::to_lower(key);
}

std::string EmailKeyKind::mask(std::string_view key) const {
    const auto at_pos = key.find('@');
    if (at_pos == std::string_view::npos) {
        return std::string(key);
    }

    const std::string_view local = key.substr(0, at_pos);
    const std::string_view domain = key.substr(at_pos);  // keeps the '@'
    if (local.size() > 1) {
        return std::format("{}***{}", local.substr(0, 1), domain);
    }
    return std::format("***{}", domain);
}

// ============================================================================
// Phone
// ============================================================================

bool PhoneKeyKind::matches(std::string_view key) const {
    return regex_matches(key, patterns::pix_phone());
}

Result<std::string> PhoneKeyKind::validate(std::string_view key) const {
    return Result<std::string>::ok(std::string(key));
}

std::string PhoneKeyKind::normalize(std::string_view key) const {
    return std::string(key);
}

std::string PhoneKeyKind::mask(std::string_view key) const {
    // +5511987654321 -> +55 (11) *****-4321
    if (key.size() < 14) {
        return std::string(key);
    }
    return std::format("+55 ({}) *****-{}", key.substr(3, 2), key.substr(key.size() - 4));
}

// ============================================================================
// Random key
// ============================================================================

bool RandomKeyKind::matches(std::string_view key) const {
    const std::string lower = utils::to_lower(key);
    return regex_matches(lower, patterns::random_key());
}

Result<std::string> RandomKeyKind::validate(std::string_view key) const {
    return Result<std::string>::ok(normalize(key));
}

std::string RandomKeyKind::normalize(std::string_view key) const {
    return utils::to_lower(key);
}

std::string RandomKeyKind::mask(std::string_view key) const {
    if (key.size() < 8) {
        return std::string(key);
    }
    return std::format("{}{}", key.substr(0, 4), kRandomKeyMaskTail);
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<const IPixKeyKind> make_pix_key_kind(PixKeyType type) {
    switch (type) {
        case PixKeyType::CPF:    return std::make_shared<CpfKeyKind>();
        case PixKeyType::CNPJ:   return std::make_shared<CnpjKeyKind>();
        case PixKeyType::EMAIL:  return std::make_shared<EmailKeyKind>();
        case PixKeyType::PHONE:  return std::make_shared<PhoneKeyKind>();
        case PixKeyType::RANDOM: return std::make_shared<RandomKeyKind>();
    }
    return nullptr;
}

} // namespace brdocs
