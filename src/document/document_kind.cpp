#include "document/document_kind.hpp"
#include "document/cep.hpp"
#include "document/cnpj.hpp"
#include "document/cpf.hpp"
#include "document/phone.hpp"
#include "core/utils.hpp"

#include <unordered_map>

namespace brdocs {

std::string_view document_kind_to_string(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::CPF:   return "cpf";
        case DocumentKind::CNPJ:  return "cnpj";
        case DocumentKind::CEP:   return "cep";
        case DocumentKind::PHONE: return "phone";
    }
    return "unknown";
}

std::optional<DocumentKind> parse_document_kind(std::string_view name) {
    static const std::unordered_map<std::string, DocumentKind> lookup = {
        {"cpf",   DocumentKind::CPF},
        {"cnpj",  DocumentKind::CNPJ},
        {"cep",   DocumentKind::CEP},
        {"phone", DocumentKind::PHONE},
    };

    const auto it = lookup.find(utils::to_lower(name));
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::string normalize_document(DocumentKind kind, std::string_view raw) {
    switch (kind) {
        case DocumentKind::CPF:   return cpf::normalize(raw);
        case DocumentKind::CNPJ:  return cnpj::normalize(raw);
        case DocumentKind::CEP:   return cep::normalize(raw);
        case DocumentKind::PHONE: return phone::normalize(raw);
    }
    return std::string(raw);
}

Result<std::string> validate_document(DocumentKind kind, std::string_view raw) {
    switch (kind) {
        case DocumentKind::CPF:   return cpf::validate(raw);
        case DocumentKind::CNPJ:  return cnpj::validate(raw);
        case DocumentKind::CEP:   return cep::validate(raw);
        case DocumentKind::PHONE: return phone::validate(raw);
    }
    return Result<std::string>::error(
        ValidationError::invalid_document_format(std::string(document_kind_to_string(kind))));
}

std::string format_document(DocumentKind kind, std::string_view raw) {
    switch (kind) {
        case DocumentKind::CPF:   return cpf::format(raw);
        case DocumentKind::CNPJ:  return cnpj::format(raw);
        case DocumentKind::CEP:   return cep::format(raw);
        case DocumentKind::PHONE: return phone::format(raw);
    }
    return std::string(raw);
}

std::string mask_document(DocumentKind kind, std::string_view raw) {
    switch (kind) {
        case DocumentKind::CPF:   return cpf::mask(raw);
        case DocumentKind::CNPJ:  return cnpj::mask(raw);
        case DocumentKind::CEP:   return cep::mask(raw);
        case DocumentKind::PHONE: return phone::mask(raw);
    }
    return std::string(raw);
}

bool is_document_format(DocumentKind kind, std::string_view raw) {
    switch (kind) {
        case DocumentKind::CPF:   return cpf::is_cpf_format(raw);
        case DocumentKind::CNPJ:  return cnpj::is_cnpj_format(raw);
        case DocumentKind::CEP:   return cep::is_cep_format(raw);
        case DocumentKind::PHONE: return phone::is_phone_format(raw);
    }
    return false;
}

} // namespace brdocs
