#pragma once

#include "core/error.hpp"
#include "pix/pix_key_type.hpp"

#include <string>
#include <string_view>

namespace brdocs {

/**
 * @brief Interface for one kind of PIX key
 *
 * Each kind recognizes its own shape and knows how to validate, canonicalize
 * and mask it. PixDispatcher asks kinds in order and hands the key to the
 * first one whose shape matches.
 *
 * All methods receive an already-trimmed key.
 */
class IPixKeyKind {
public:
    virtual ~IPixKeyKind() = default;

    [[nodiscard]] virtual PixKeyType type() const = 0;

    /// Structural match only; no check digits
    [[nodiscard]] virtual bool matches(std::string_view key) const = 0;

    /**
     * @brief Full validation of a key that matches()
     * @return Canonical key value, or the kind's validation error
     */
    [[nodiscard]] virtual Result<std::string> validate(std::string_view key) const = 0;

    /// Canonical form without semantic validation
    [[nodiscard]] virtual std::string normalize(std::string_view key) const = 0;

    [[nodiscard]] virtual std::string mask(std::string_view key) const = 0;
};

} // namespace brdocs
