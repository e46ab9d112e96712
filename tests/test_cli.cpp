#include <catch2/catch_test_macros.hpp>
#include "cli/cli.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

using namespace brdocs;

namespace {

struct CliOutput {
    int exit_code;
    std::string out;
    std::string err;
};

CliOutput run_cli(std::initializer_list<std::string_view> args) {
    const std::vector<std::string_view> argv(args);
    std::ostringstream out;
    std::ostringstream err;
    const int code = cli::run(argv, out, err);
    return {code, out.str(), err.str()};
}

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ============================================================================
// Document commands
// ============================================================================

TEST_CASE("CLI: validate prints the canonical value", "[cli]") {
    const auto r = run_cli({"validate", "cpf", "123.456.789-09"});
    CHECK(r.exit_code == cli::kExitOk);
    CHECK(r.out == "12345678909\n");
    CHECK(r.err.empty());
}

TEST_CASE("CLI: invalid input prints the JSON error body", "[cli]") {
    const auto r = run_cli({"validate", "cnpj", "11.111.111/1111-11"});
    CHECK(r.exit_code == cli::kExitInvalid);
    CHECK(contains(r.out, R"("code":"INVALID_CNPJ")"));
    CHECK(contains(r.out, R"("document_type":"CNPJ")"));
}

TEST_CASE("CLI: format, mask and normalize", "[cli]") {
    CHECK(run_cli({"format", "cep", "12345678"}).out == "12345-678\n");
    CHECK(run_cli({"mask", "phone", "11987654321"}).out == "(11) *****-4321\n");
    CHECK(run_cli({"normalize", "CPF", "123.456.789-09"}).out == "12345678909\n");
}

TEST_CASE("CLI: check reports the shape match in the exit code", "[cli]") {
    const auto good = run_cli({"check", "cep", "01310-100"});
    CHECK(good.exit_code == cli::kExitOk);
    CHECK(good.out == "true\n");

    const auto bad = run_cli({"check", "cep", "abc"});
    CHECK(bad.exit_code == cli::kExitInvalid);
    CHECK(bad.out == "false\n");
}

// ============================================================================
// PIX commands
// ============================================================================

TEST_CASE("CLI: detect prints the key type name", "[cli][pix]") {
    const auto r = run_cli({"detect", "user@example.com"});
    CHECK(r.exit_code == cli::kExitOk);
    CHECK(r.out == "email\n");

    const auto unknown = run_cli({"detect", "hello"});
    CHECK(unknown.exit_code == cli::kExitInvalid);
    CHECK(contains(unknown.out, R"("code":"INVALID_PIX_KEY")"));
}

TEST_CASE("CLI: validate pix prints type and canonical key", "[cli][pix]") {
    const auto r = run_cli({"validate", "pix", "User@Example.com"});
    CHECK(r.exit_code == cli::kExitOk);
    CHECK(r.out == "email user@example.com\n");

    CHECK(run_cli({"mask", "pix", "+5511987654321"}).out == "+55 (11) *****-4321\n");
}

TEST_CASE("CLI: format is a usage error for PIX keys", "[cli][pix]") {
    const auto r = run_cli({"format", "pix", "x"});
    CHECK(r.exit_code == cli::kExitUsage);
    CHECK(r.out.empty());
    CHECK(contains(r.err, "usage:"));
}

// ============================================================================
// Usage errors
// ============================================================================

TEST_CASE("CLI: malformed invocations exit with the usage code", "[cli]") {
    SECTION("No arguments") {
        CHECK(run_cli({}).exit_code == cli::kExitUsage);
    }

    SECTION("Unknown command") {
        const auto r = run_cli({"frobnicate", "cpf", "1"});
        CHECK(r.exit_code == cli::kExitUsage);
        CHECK(contains(r.err, "unknown command 'frobnicate'"));
    }

    SECTION("Unknown document kind") {
        const auto r = run_cli({"validate", "rg", "123"});
        CHECK(r.exit_code == cli::kExitUsage);
        CHECK(contains(r.err, "unknown document kind 'rg'"));
    }

    SECTION("Wrong argument count") {
        CHECK(run_cli({"validate", "cpf"}).exit_code == cli::kExitUsage);
        CHECK(run_cli({"detect", "a", "b"}).exit_code == cli::kExitUsage);
    }

    SECTION("Unreadable config") {
        CHECK(run_cli({"--config", "/nonexistent/brdocs.toml", "detect", "x"}).exit_code ==
              cli::kExitUsage);
    }
}

// ============================================================================
// Configuration
// ============================================================================

TEST_CASE("CLI: config restricts PIX key types", "[cli][config]") {
    const auto before = utils::log::level();
    const auto path = std::filesystem::temp_directory_path() / "brdocs_cli_test.toml";
    {
        std::ofstream file(path);
        file << "[logging]\nlevel = \"error\"\n\n[pix]\nkey_types = [\"email\"]\n";
    }
    const std::string config_path = path.string();

    const auto email = run_cli({"--config", config_path, "detect", "user@example.com"});
    CHECK(email.exit_code == cli::kExitOk);
    CHECK(email.out == "email\n");

    const auto cpf = run_cli({"--config", config_path, "detect", "12345678909"});
    CHECK(cpf.exit_code == cli::kExitInvalid);
    CHECK(contains(cpf.out, "INVALID_PIX_KEY"));

    std::filesystem::remove(path);
    utils::log::set_level(before);
}
