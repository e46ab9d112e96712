#pragma once

#include "pix/ipix_key_kind.hpp"

#include <memory>

namespace brdocs {

/// CPF key: delegates to the CPF engine
class CpfKeyKind final : public IPixKeyKind {
public:
    [[nodiscard]] PixKeyType type() const override { return PixKeyType::CPF; }
    [[nodiscard]] bool matches(std::string_view key) const override;
    [[nodiscard]] Result<std::string> validate(std::string_view key) const override;
    [[nodiscard]] std::string normalize(std::string_view key) const override;
    [[nodiscard]] std::string mask(std::string_view key) const override;
};

/// CNPJ key: delegates to the CNPJ engine
class CnpjKeyKind final : public IPixKeyKind {
public:
    [[nodiscard]] PixKeyType type() const override { return PixKeyType::CNPJ; }
    [[nodiscard]] bool matches(std::string_view key) const override;
    [[nodiscard]] Result<std::string> validate(std::string_view key) const override;
    [[nodiscard]] std::string normalize(std::string_view key) const override;
    [[nodiscard]] std::string mask(std::string_view key) const override;
};

/// Email key: accepted on shape, canonicalized to lowercase, masked as u***@domain
class EmailKeyKind final : public IPixKeyKind {
public:
    [[nodiscard]] PixKeyType type() const override { return PixKeyType::EMAIL; }
    [[nodiscard]] bool matches(std::string_view key) const override;
    [[nodiscard]] Result<std::string> validate(std::string_view key) const override;
    [[nodiscard]] std::string normalize(std::string_view key) const override;
    [[nodiscard]] std::string mask(std::string_view key) const override;
};

/**
 * @brief Phone key: strictly "+55" plus 11 digits
 *
 * Stricter than the general phone engine; the key is kept verbatim.
 */
class PhoneKeyKind final : public IPixKeyKind {
public:
    [[nodiscard]] PixKeyType type() const override { return PixKeyType::PHONE; }
    [[nodiscard]] bool matches(std::string_view key) const override;
    [[nodiscard]] Result<std::string> validate(std::string_view key) const override;
    [[nodiscard]] std::string normalize(std::string_view key) const override;
    [[nodiscard]] std::string mask(std::string_view key) const override;
};

/// Random key: 8-4-4-4-12 hex token, any case on input, lowercase canonical
class RandomKeyKind final : public IPixKeyKind {
public:
    [[nodiscard]] PixKeyType type() const override { return PixKeyType::RANDOM; }
    [[nodiscard]] bool matches(std::string_view key) const override;
    [[nodiscard]] Result<std::string> validate(std::string_view key) const override;
    [[nodiscard]] std::string normalize(std::string_view key) const override;
    [[nodiscard]] std::string mask(std::string_view key) const override;
};

/// Factory for the built-in kinds
[[nodiscard]] std::shared_ptr<const IPixKeyKind> make_pix_key_kind(PixKeyType type);

} // namespace brdocs
