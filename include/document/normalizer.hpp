#pragma once

#include <string>
#include <string_view>

namespace brdocs::normalizer {

/**
 * @brief Keep only ASCII decimal digits
 */
[[nodiscard]] std::string digits_only(std::string_view raw);

/**
 * @brief Keep digits plus a leading '+' marker
 *
 * A '+' survives only when no digit has been retained before it, so
 * "+55 (11) 9..." keeps its marker while "11+9..." loses the stray '+'.
 */
[[nodiscard]] std::string digits_with_plus(std::string_view raw);

} // namespace brdocs::normalizer
