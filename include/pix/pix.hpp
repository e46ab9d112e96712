#pragma once

#include "pix/pix_dispatcher.hpp"

/**
 * @brief PIX key entry points backed by a process-wide default dispatcher
 *
 * The default dispatcher holds all five kinds in canonical order and trims
 * input. Code that needs a restricted set of kinds builds its own
 * PixDispatcher (see make_pix_dispatcher).
 */
namespace brdocs::pix {

[[nodiscard]] const PixDispatcher& default_dispatcher();

[[nodiscard]] Result<void> validate(std::string_view key);
[[nodiscard]] std::optional<PixKeyType> detect_type(std::string_view key);
[[nodiscard]] Result<PixKeyClassification> validate_with_type(std::string_view key);
[[nodiscard]] std::string normalize(std::string_view key);
[[nodiscard]] std::string mask(std::string_view key);

} // namespace brdocs::pix

namespace brdocs {

[[nodiscard]] inline Result<void> validate_pix_key(std::string_view key) { return pix::validate(key); }
[[nodiscard]] inline std::optional<PixKeyType> detect_pix_type(std::string_view key) { return pix::detect_type(key); }

} // namespace brdocs
