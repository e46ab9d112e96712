#include <catch2/catch_test_macros.hpp>
#include "pix/pix.hpp"
#include "pix/pix_key_kinds.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace brdocs;

// ============================================================================
// Type detection
// ============================================================================

TEST_CASE("PIX: detect_type classifies each key kind", "[pix]") {
    CHECK(pix::detect_type("123.456.789-09") == PixKeyType::CPF);
    CHECK(pix::detect_type("11.222.333/0001-81") == PixKeyType::CNPJ);
    CHECK(detect_pix_type("user@example.com") == PixKeyType::EMAIL);
    CHECK(pix::detect_type("+5511987654321") == PixKeyType::PHONE);
    CHECK(detect_pix_type("123e4567-e89b-12d3-a456-426614174000") == PixKeyType::RANDOM);
    CHECK(pix::detect_type("123E4567-E89B-12D3-A456-426614174000") == PixKeyType::RANDOM);
}

TEST_CASE("PIX: unrecognized keys", "[pix]") {
    for (const auto* key : {"", "hello", "+55 11 98765-4321", "+551198765432", "user@", "12345"}) {
        CHECK_FALSE(pix::detect_type(key).has_value());

        const auto validated = pix::validate(key);
        REQUIRE(validated.is_error());
        CHECK(validated.error().kind() == ErrorKind::INVALID_PIX_KEY);

        CHECK(pix::validate_with_type(key).error().kind() == ErrorKind::INVALID_PIX_KEY);
    }
}

TEST_CASE("PIX: oversized keys are rejected without running recognizers", "[pix]") {
    SECTION("Email-shaped key far beyond the length limit") {
        const std::string key = std::string(200000, 'a') + "@example.com";
        CHECK_FALSE(pix::detect_type(key).has_value());

        const auto result = pix::validate(key);
        REQUIRE(result.is_error());
        CHECK(result.error().kind() == ErrorKind::INVALID_PIX_KEY);
        CHECK(pix::mask(key) == key);
    }

    SECTION("Plain run of letters") {
        const std::string key(200000, 'a');
        CHECK_FALSE(pix::detect_type(key).has_value());
        CHECK(pix::validate(key).error().kind() == ErrorKind::INVALID_PIX_KEY);
        CHECK(pix::validate_with_type(key).error().kind() == ErrorKind::INVALID_PIX_KEY);
        CHECK(pix::normalize(key) == key);
    }

    SECTION("Length limit boundary") {
        // 65 + "@example.com" (12) = 77 characters
        const std::string longest = std::string(65, 'a') + "@example.com";
        REQUIRE(longest.size() == PixDispatcher::kMaxKeyLength);
        CHECK(pix::detect_type(longest) == PixKeyType::EMAIL);
        CHECK(pix::validate(longest).is_ok());

        const std::string too_long = "a" + longest;
        CHECK_FALSE(pix::detect_type(too_long).has_value());
    }

    SECTION("Surrounding whitespace does not count toward the limit") {
        const std::string padded = std::string(100, ' ') + "user@example.com";
        CHECK(pix::detect_type(padded) == PixKeyType::EMAIL);
    }
}

TEST_CASE("PIX: rejecting a key writes nothing to the log", "[pix][logging]") {
    const auto before = utils::log::level();
    utils::log::set_level(utils::log::Level::DEBUG);

    std::ostringstream captured;
    auto* original = std::cerr.rdbuf(captured.rdbuf());
    const auto result = pix::validate_with_type("hello");
    const auto detected = pix::detect_type("hello");
    std::cerr.rdbuf(original);
    utils::log::set_level(before);

    CHECK(result.is_error());
    CHECK_FALSE(detected.has_value());
    CHECK(captured.str().empty());
}

TEST_CASE("PIX: precedence favors tax IDs over later kinds", "[pix]") {
    // An 11-digit bare number is CPF-shaped before it could be anything else
    CHECK(pix::detect_type("11987654321") == PixKeyType::CPF);

    SECTION("A CPF-shaped key with bad check digits fails as a CPF") {
        const auto result = pix::validate("12345678900");
        REQUIRE(result.is_error());
        CHECK(result.error().kind() == ErrorKind::INVALID_CHECK_DIGITS);
        CHECK(result.error().document_type() == "CPF");
    }

    SECTION("A CNPJ-shaped repeated sequence fails as a CNPJ") {
        CHECK(pix::validate("11.111.111/1111-11").error().kind() == ErrorKind::INVALID_CNPJ);
    }
}

// ============================================================================
// Validation with canonical value
// ============================================================================

TEST_CASE("PIX: validate_with_type canonicalizes per kind", "[pix]") {
    SECTION("Tax IDs are digit-normalized") {
        const auto cpf = pix::validate_with_type("123.456.789-09");
        REQUIRE(cpf.is_ok());
        CHECK(cpf.value().type == PixKeyType::CPF);
        CHECK(cpf.value().value == "12345678909");

        const auto cnpj = pix::validate_with_type("11.222.333/0001-81");
        REQUIRE(cnpj.is_ok());
        CHECK(cnpj.value().value == "11222333000181");
    }

    SECTION("Email and random keys are lowercased") {
        const auto email = pix::validate_with_type("User.Name@Example.COM");
        REQUIRE(email.is_ok());
        CHECK(email.value().type == PixKeyType::EMAIL);
        CHECK(email.value().value == "user.name@example.com");

        const auto random = pix::validate_with_type("123E4567-E89B-12D3-A456-426614174000");
        REQUIRE(random.is_ok());
        CHECK(random.value().value == "123e4567-e89b-12d3-a456-426614174000");
    }

    SECTION("Phone is kept verbatim") {
        const auto phone = pix::validate_with_type("+5511987654321");
        REQUIRE(phone.is_ok());
        CHECK(phone.value().type == PixKeyType::PHONE);
        CHECK(phone.value().value == "+5511987654321");
    }

    SECTION("Surrounding whitespace is ignored") {
        const auto email = pix::validate_with_type("  user@example.com\n");
        REQUIRE(email.is_ok());
        CHECK(email.value().value == "user@example.com");
        CHECK(validate_pix_key(" 123.456.789-09 ").is_ok());
    }
}

TEST_CASE("PIX: normalize", "[pix]") {
    CHECK(pix::normalize("123.456.789-09") == "12345678909");
    CHECK(pix::normalize("USER@EXAMPLE.COM") == "user@example.com");
    CHECK(pix::normalize("+5511987654321") == "+5511987654321");
    CHECK(pix::normalize(" not a key ") == "not a key");
}

// ============================================================================
// Masking
// ============================================================================

TEST_CASE("PIX: mask per kind", "[pix][masking]") {
    CHECK(pix::mask("12345678909") == "123.***.***-09");
    CHECK(pix::mask("11.222.333/0001-81") == "11.***.***/**01-81");
    CHECK(pix::mask("user@example.com") == "u***@example.com");
    CHECK(pix::mask("a@example.com") == "***@example.com");
    CHECK(pix::mask("+5511987654321") == "+55 (11) *****-4321");
    CHECK(pix::mask("123e4567-e89b-12d3-a456-426614174000") == "123e****-****-****-****-****");
}

TEST_CASE("PIX: mask leaves unrecognized keys unchanged", "[pix][masking]") {
    CHECK(pix::mask("hello") == "hello");
    CHECK(pix::mask("").empty());
}

// ============================================================================
// Dispatcher composition
// ============================================================================

TEST_CASE("PixDispatcher: default kinds in canonical order", "[pix][dispatcher]") {
    const auto dispatcher = PixDispatcher::with_default_kinds();
    CHECK(dispatcher.kind_count() == 5);
    CHECK(dispatcher.kind_types() == std::vector<PixKeyType>{
        PixKeyType::CPF, PixKeyType::CNPJ, PixKeyType::EMAIL,
        PixKeyType::PHONE, PixKeyType::RANDOM});
}

TEST_CASE("PixDispatcher: subsets keep canonical precedence", "[pix][dispatcher]") {
    const auto dispatcher = PixDispatcher::with_kinds(
        {PixKeyType::RANDOM, PixKeyType::EMAIL, PixKeyType::RANDOM});
    CHECK(dispatcher.kind_types() == std::vector<PixKeyType>{PixKeyType::EMAIL, PixKeyType::RANDOM});

    CHECK(dispatcher.detect_type("user@example.com") == PixKeyType::EMAIL);
    CHECK_FALSE(dispatcher.detect_type("12345678909").has_value());
    CHECK(dispatcher.validate("12345678909").error().kind() == ErrorKind::INVALID_PIX_KEY);
}

TEST_CASE("PixDispatcher: empty dispatcher recognizes nothing", "[pix][dispatcher]") {
    const PixDispatcher dispatcher{};
    CHECK(dispatcher.kind_count() == 0);
    CHECK(dispatcher.match("user@example.com") == nullptr);
    CHECK(dispatcher.validate("user@example.com").is_error());
    CHECK(dispatcher.mask("user@example.com") == "user@example.com");
}

TEST_CASE("PixDispatcher: insertion order decides precedence", "[pix][dispatcher]") {
    PixDispatcher dispatcher;
    dispatcher.add_kind(std::make_shared<PhoneKeyKind>());
    dispatcher.add_kind(nullptr);
    CHECK(dispatcher.kind_count() == 1);
    CHECK(dispatcher.detect_type("+5511987654321") == PixKeyType::PHONE);
    CHECK_FALSE(dispatcher.detect_type("12345678909").has_value());
}

TEST_CASE("PixDispatcher: trimming can be disabled", "[pix][dispatcher]") {
    const auto dispatcher = PixDispatcher::with_default_kinds(
        PixDispatcher::Options{.trim_input = false});
    CHECK_FALSE(dispatcher.detect_type(" user@example.com").has_value());
    CHECK(dispatcher.detect_type("user@example.com") == PixKeyType::EMAIL);
}

TEST_CASE("PixKeyType: display and config names", "[pix]") {
    CHECK(pix_key_type_to_string(PixKeyType::EMAIL) == "E-mail");
    CHECK(pix_key_type_to_string(PixKeyType::PHONE) == "Telefone");
    CHECK(pix_key_type_to_string(PixKeyType::RANDOM) == "Chave aleatória");
    CHECK(pix_key_type_name(PixKeyType::RANDOM) == "random");

    CHECK(parse_pix_key_type("EMAIL") == PixKeyType::EMAIL);
    CHECK(parse_pix_key_type("cnpj") == PixKeyType::CNPJ);
    CHECK_FALSE(parse_pix_key_type("evp").has_value());
}

// ============================================================================
// Determinism under concurrency
// ============================================================================

TEST_CASE("PIX: classification is stable across threads", "[pix][concurrency]") {
    const std::vector<std::string> keys = {
        "123.456.789-09",
        "11222333000181",
        "user@example.com",
        "+5511987654321",
        "123e4567-e89b-12d3-a456-426614174000",
        "not-a-key",
        "11987654321",
    };

    std::vector<std::optional<PixKeyType>> expected;
    for (const auto& key : keys) {
        expected.push_back(pix::detect_type(key));
    }

    constexpr int kThreads = 8;
    constexpr int kIterations = 200;
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < kIterations; ++i) {
                const size_t idx = static_cast<size_t>(t + i) % keys.size();
                if (pix::detect_type(keys[idx]) != expected[idx]) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
                if (pix::validate(keys[idx]).is_ok() != (idx < 5)) {
                    mismatches.fetch_add(1, std::memory_order_relaxed);
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(mismatches.load() == 0);
}
