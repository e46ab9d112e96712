#include <catch2/catch_test_macros.hpp>
#include "core/checksum.hpp"
#include "document/cpf.hpp"

#include <array>
#include <random>
#include <string>

using namespace brdocs;

namespace {

constexpr std::array<int, 9>  kCpfFirst  = {10, 9, 8, 7, 6, 5, 4, 3, 2};
constexpr std::array<int, 10> kCpfSecond = {11, 10, 9, 8, 7, 6, 5, 4, 3, 2};

std::string complete_cpf(std::string base) {
    base += static_cast<char>('0' + checksum::mod11_check_digit(base, kCpfFirst));
    base += static_cast<char>('0' + checksum::mod11_check_digit(base, kCpfSecond));
    return base;
}

char bump(char d) {
    return static_cast<char>('0' + ((d - '0' + 1) % 10));
}

} // anonymous namespace

TEST_CASE("Checksum: mod11 digit", "[checksum]") {
    CHECK(checksum::mod11_check_digit("123456789", kCpfFirst) == 0);
    CHECK(checksum::mod11_check_digit("1234567890", kCpfSecond) == 9);
    CHECK(checksum::mod11_check_digit("529982247", kCpfFirst) == 2);

    SECTION("Too few digits") {
        CHECK(checksum::mod11_check_digit("1234", kCpfFirst) == -1);
    }

    SECTION("Non-digit inside the weighted prefix") {
        CHECK(checksum::mod11_check_digit("12345x789", kCpfFirst) == -1);
    }
}

TEST_CASE("Checksum: verify pair", "[checksum]") {
    CHECK(checksum::verify_mod11_pair("12345678909", kCpfFirst, kCpfSecond));
    CHECK_FALSE(checksum::verify_mod11_pair("12345678908", kCpfFirst, kCpfSecond));
    CHECK_FALSE(checksum::verify_mod11_pair("123456789", kCpfFirst, kCpfSecond));
}

TEST_CASE("Checksum: generated CPFs validate and corrupted ones do not", "[checksum][cpf]") {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<int> digit(0, 9);

    int checked = 0;
    while (checked < 500) {
        std::string base;
        for (int i = 0; i < 9; ++i) {
            base += static_cast<char>('0' + digit(rng));
        }
        if (base.find_first_not_of(base.front()) == std::string::npos) {
            continue;
        }
        ++checked;

        const std::string good = complete_cpf(base);
        const auto ok = cpf::validate(good);
        REQUIRE(ok.is_ok());
        CHECK(ok.value() == good);

        std::string bad_first = good;
        bad_first[9] = bump(bad_first[9]);
        CHECK(cpf::validate(bad_first).error().kind() == ErrorKind::INVALID_CHECK_DIGITS);

        std::string bad_second = good;
        bad_second[10] = bump(bad_second[10]);
        CHECK(cpf::validate(bad_second).error().kind() == ErrorKind::INVALID_CHECK_DIGITS);
    }
}
