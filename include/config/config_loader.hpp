#pragma once

#include "pix/pix_dispatcher.hpp"

#include <string>
#include <vector>

namespace brdocs {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// PIX Config
// ============================================================================

struct PixConfig {
    // Enabled key kinds by name; precedence stays canonical regardless of order
    std::vector<std::string> key_types = {"cpf", "cnpj", "email", "phone", "random"};
    bool trim_input = true;
};

// ============================================================================
// Top-level config
// ============================================================================

struct BrdocsConfig {
    LoggingConfig logging;
    PixConfig pix;
};

// ============================================================================
// ConfigLoader - Extract typed config from parsed TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success = false;
        std::string error_message;
        BrdocsConfig config;

        static LoadResult ok(BrdocsConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to brdocs.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks on an extracted config
     * @return One message per problem; empty when the config is usable
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const BrdocsConfig& config);

private:
    static LoadResult validate_and_return(BrdocsConfig config);
};

/// Apply logging.level to the process-wide logger
void apply_logging_config(const LoggingConfig& config);

/**
 * @brief Build a PIX dispatcher holding the configured key kinds
 *
 * Unknown names are skipped (validate_config reports them).
 */
[[nodiscard]] PixDispatcher make_pix_dispatcher(const PixConfig& config);

} // namespace brdocs
