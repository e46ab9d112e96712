#include "core/error.hpp"

#include <format>

namespace brdocs {

ValidationError ValidationError::invalid_cpf(std::string detail) {
    return {ErrorKind::INVALID_CPF, std::move(detail)};
}

ValidationError ValidationError::invalid_cnpj(std::string detail) {
    return {ErrorKind::INVALID_CNPJ, std::move(detail)};
}

ValidationError ValidationError::invalid_cep(std::string detail) {
    return {ErrorKind::INVALID_CEP, std::move(detail)};
}

ValidationError ValidationError::invalid_phone(std::string detail) {
    return {ErrorKind::INVALID_PHONE, std::move(detail)};
}

ValidationError ValidationError::invalid_pix_key(std::string detail) {
    return {ErrorKind::INVALID_PIX_KEY, std::move(detail)};
}

ValidationError ValidationError::invalid_document_format(std::string document_type) {
    return {ErrorKind::INVALID_DOCUMENT_FORMAT, std::move(document_type)};
}

ValidationError ValidationError::invalid_check_digits(std::string document_type) {
    return {ErrorKind::INVALID_CHECK_DIGITS, std::move(document_type)};
}

ValidationError ValidationError::invalid_characters() {
    return {ErrorKind::INVALID_CHARACTERS, {}};
}

ValidationError ValidationError::invalid_length(size_t expected, size_t actual) {
    ValidationError err(ErrorKind::INVALID_LENGTH, {});
    err.expected_ = expected;
    err.actual_ = actual;
    return err;
}

std::string_view ValidationError::code() const {
    return error_kind_to_string(kind_);
}

std::string_view ValidationError::document_type() const {
    switch (kind_) {
        case ErrorKind::INVALID_CPF:             return "CPF";
        case ErrorKind::INVALID_CNPJ:            return "CNPJ";
        case ErrorKind::INVALID_CEP:             return "CEP";
        case ErrorKind::INVALID_PHONE:           return "phone";
        case ErrorKind::INVALID_PIX_KEY:         return "PIX key";
        case ErrorKind::INVALID_DOCUMENT_FORMAT:
        case ErrorKind::INVALID_CHECK_DIGITS:    return detail_;
        case ErrorKind::INVALID_CHARACTERS:
        case ErrorKind::INVALID_LENGTH:          return "document";
    }
    return "document";
}

std::string ValidationError::message() const {
    switch (kind_) {
        case ErrorKind::INVALID_CPF:
            return std::format("CPF inválido: {}", detail_);
        case ErrorKind::INVALID_CNPJ:
            return std::format("CNPJ inválido: {}", detail_);
        case ErrorKind::INVALID_CEP:
            return std::format("CEP inválido: {}", detail_);
        case ErrorKind::INVALID_PHONE:
            return std::format("Telefone inválido: {}", detail_);
        case ErrorKind::INVALID_PIX_KEY:
            return std::format("Chave PIX inválida: {}", detail_);
        case ErrorKind::INVALID_DOCUMENT_FORMAT:
            return std::format("Formato de documento inválido: {}", detail_);
        case ErrorKind::INVALID_CHECK_DIGITS:
            return std::format("Dígitos verificadores inválidos para {}", detail_);
        case ErrorKind::INVALID_CHARACTERS:
            return "Caracteres inválidos no documento";
        case ErrorKind::INVALID_LENGTH:
            return std::format("Tamanho inválido: esperado {}, recebido {}", expected_, actual_);
    }
    return "Erro de validação";
}

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::INVALID_CPF:             return "INVALID_CPF";
        case ErrorKind::INVALID_CNPJ:            return "INVALID_CNPJ";
        case ErrorKind::INVALID_CEP:             return "INVALID_CEP";
        case ErrorKind::INVALID_PHONE:           return "INVALID_PHONE";
        case ErrorKind::INVALID_PIX_KEY:         return "INVALID_PIX_KEY";
        case ErrorKind::INVALID_DOCUMENT_FORMAT: return "INVALID_DOCUMENT_FORMAT";
        case ErrorKind::INVALID_CHECK_DIGITS:    return "INVALID_CHECK_DIGITS";
        case ErrorKind::INVALID_CHARACTERS:      return "INVALID_CHARACTERS";
        case ErrorKind::INVALID_LENGTH:          return "INVALID_LENGTH";
    }
    return "UNKNOWN";
}

} // namespace brdocs
