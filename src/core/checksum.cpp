#include "core/checksum.hpp"
#include "core/utils.hpp"

namespace brdocs::checksum {

int mod11_check_digit(std::string_view digits, std::span<const int> weights) {
    if (digits.size() < weights.size()) {
        return -1;
    }

    int sum = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        if (!utils::is_ascii_digit(digits[i])) {
            return -1;
        }
        sum += (digits[i] - '0') * weights[i];
    }

    const int rem = sum % 11;
    return rem < 2 ? 0 : 11 - rem;
}

bool verify_mod11_pair(std::string_view digits,
                       std::span<const int> first,
                       std::span<const int> second) {
    if (digits.size() <= first.size() || digits.size() <= second.size()) {
        return false;
    }

    const int check1 = mod11_check_digit(digits, first);
    if (check1 < 0 || check1 != digits[first.size()] - '0') {
        return false;
    }

    const int check2 = mod11_check_digit(digits, second);
    return check2 >= 0 && check2 == digits[second.size()] - '0';
}

} // namespace brdocs::checksum
