#include "document/normalizer.hpp"
#include "core/utils.hpp"

namespace brdocs::normalizer {

std::string digits_only(std::string_view raw) {
    std::string result;
    result.reserve(raw.size());
    for (const char c : raw) {
        if (utils::is_ascii_digit(c)) {
            result += c;
        }
    }
    return result;
}

std::string digits_with_plus(std::string_view raw) {
    std::string result;
    result.reserve(raw.size());
    for (const char c : raw) {
        if (utils::is_ascii_digit(c)) {
            result += c;
        } else if (c == '+' && result.empty()) {
            result += c;
        }
    }
    return result;
}

} // namespace brdocs::normalizer
