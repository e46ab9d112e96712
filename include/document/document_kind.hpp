#pragma once

#include "core/error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace brdocs {

enum class DocumentKind {
    CPF,
    CNPJ,
    CEP,
    PHONE
};

[[nodiscard]] std::string_view document_kind_to_string(DocumentKind kind);

/// Parse "cpf" / "cnpj" / "cep" / "phone" (case-insensitive)
[[nodiscard]] std::optional<DocumentKind> parse_document_kind(std::string_view name);

// Kind-generic entry points forwarding to the per-kind engines
[[nodiscard]] std::string normalize_document(DocumentKind kind, std::string_view raw);
[[nodiscard]] Result<std::string> validate_document(DocumentKind kind, std::string_view raw);
[[nodiscard]] std::string format_document(DocumentKind kind, std::string_view raw);
[[nodiscard]] std::string mask_document(DocumentKind kind, std::string_view raw);
[[nodiscard]] bool is_document_format(DocumentKind kind, std::string_view raw);

} // namespace brdocs
