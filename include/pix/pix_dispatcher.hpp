#pragma once

#include "pix/ipix_key_kind.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brdocs {

/// Options for PixDispatcher (declared at namespace scope so its default
/// member initializer is usable in PixDispatcher's default arguments)
struct PixDispatcherOptions {
    bool trim_input = true;     // strip surrounding whitespace before matching
};

/**
 * @brief Ordered list of PIX key kinds
 *
 * The first kind whose matches() accepts the key owns it; later kinds are
 * never consulted. All entry points (validate, detect_type,
 * validate_with_type, mask) share that single lookup, so a key resolves to
 * the same kind everywhere.
 *
 * Immutable after construction; const methods are safe to call concurrently.
 */
class PixDispatcher {
public:
    using Options = PixDispatcherOptions;

    /// Longest legal PIX key (an email key); longer input never matches any kind
    static constexpr size_t kMaxKeyLength = 77;

    PixDispatcher() = default;
    explicit PixDispatcher(Options options) : options_(options) {}

    /// Append a kind; insertion order is match precedence
    void add_kind(std::shared_ptr<const IPixKeyKind> kind);

    /// CPF, CNPJ, email, phone, random key
    [[nodiscard]] static PixDispatcher with_default_kinds(Options options = {});

    /**
     * @brief Dispatcher restricted to a subset of the built-in kinds
     *
     * Kinds are always added in canonical precedence order, whatever order
     * @p types lists them in. Duplicates are ignored.
     */
    [[nodiscard]] static PixDispatcher with_kinds(
        const std::vector<PixKeyType>& types, Options options = {});

    /// Kind that owns @p key, or nullptr
    [[nodiscard]] const IPixKeyKind* match(std::string_view key) const;

    /**
     * @brief Full validation through the matched kind
     * @return ok, the kind's own error, or INVALID_PIX_KEY if nothing matches
     */
    [[nodiscard]] Result<void> validate(std::string_view key) const;

    /// Shape-only classification
    [[nodiscard]] std::optional<PixKeyType> detect_type(std::string_view key) const;

    /// Validate and return the type with the canonical value
    [[nodiscard]] Result<PixKeyClassification> validate_with_type(std::string_view key) const;

    /// Canonical form; unrecognized keys come back (trimmed) unchanged
    [[nodiscard]] std::string normalize(std::string_view key) const;

    /// Masked form; unrecognized keys come back (trimmed) unchanged
    [[nodiscard]] std::string mask(std::string_view key) const;

    [[nodiscard]] size_t kind_count() const { return kinds_.size(); }
    [[nodiscard]] std::vector<PixKeyType> kind_types() const;
    [[nodiscard]] const Options& options() const { return options_; }

private:
    [[nodiscard]] std::string_view prepare(std::string_view key) const;

    Options options_;
    std::vector<std::shared_ptr<const IPixKeyKind>> kinds_;
};

} // namespace brdocs
