#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace brdocs {

/**
 * @brief Validation error kinds
 */
enum class ErrorKind {
    INVALID_CPF,
    INVALID_CNPJ,
    INVALID_CEP,
    INVALID_PHONE,
    INVALID_PIX_KEY,
    INVALID_DOCUMENT_FORMAT,
    INVALID_CHECK_DIGITS,
    INVALID_CHARACTERS,
    INVALID_LENGTH
};

/**
 * @brief A validation failure with enough context to build a user-facing message
 *
 * Carries the machine-readable code, the document type label and a
 * human-readable message (Portuguese, as shown to Brazilian end users).
 */
class ValidationError {
public:
    [[nodiscard]] static ValidationError invalid_cpf(std::string detail);
    [[nodiscard]] static ValidationError invalid_cnpj(std::string detail);
    [[nodiscard]] static ValidationError invalid_cep(std::string detail);
    [[nodiscard]] static ValidationError invalid_phone(std::string detail);
    [[nodiscard]] static ValidationError invalid_pix_key(std::string detail);
    [[nodiscard]] static ValidationError invalid_document_format(std::string document_type);
    [[nodiscard]] static ValidationError invalid_check_digits(std::string document_type);
    [[nodiscard]] static ValidationError invalid_characters();
    [[nodiscard]] static ValidationError invalid_length(size_t expected, size_t actual);

    [[nodiscard]] ErrorKind kind() const { return kind_; }

    /// Stable code for API responses, e.g. "INVALID_CPF"
    [[nodiscard]] std::string_view code() const;

    /// Document type that failed validation, e.g. "CPF", "phone", "document"
    [[nodiscard]] std::string_view document_type() const;

    [[nodiscard]] std::string message() const;

    /// Kind-specific detail ("sequência de dígitos repetidos", ...). Empty for
    /// the structural kinds.
    [[nodiscard]] const std::string& detail() const { return detail_; }

    [[nodiscard]] size_t expected_length() const { return expected_; }
    [[nodiscard]] size_t actual_length() const { return actual_; }

    bool operator==(const ValidationError&) const = default;

private:
    ValidationError(ErrorKind kind, std::string detail)
        : kind_(kind), detail_(std::move(detail)) {}

    ErrorKind kind_;
    std::string detail_;        // message detail, or document type for FORMAT/CHECK_DIGITS
    size_t expected_ = 0;
    size_t actual_ = 0;
};

[[nodiscard]] std::string_view error_kind_to_string(ErrorKind kind);

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ValidationError err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return value_.has_value(); }
    bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    const ValidationError& error() const { return *error_; }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<ValidationError> error_;
};

/**
 * @brief Result for operations with no payload on success
 */
template<>
class Result<void> {
public:
    static Result ok() { return Result(); }

    static Result error(ValidationError err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const ValidationError& error() const { return *error_; }

private:
    Result() = default;

    std::optional<ValidationError> error_;
};

} // namespace brdocs
