#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace brdocs {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} references from the environment.
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t pos = 0;
    while (pos < input.size()) {
        const size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            result.append(input, pos);
            break;
        }
        result.append(input, pos, open - pos);

        const size_t close = input.find('}', open + 2);
        if (close == std::string::npos) {
            throw std::runtime_error(
                std::format("Unclosed env var substitution at position {}", open));
        }
        const std::string name = input.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            result += value;
        }
        pos = close + 1;
    }
    return result;
}

void expand_node(toml::node& node);

void expand_table(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_table(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

PixConfig extract_pix(const toml::table& root) {
    PixConfig cfg;
    const auto* pix = root["pix"].as_table();
    if (!pix) return cfg;
    const auto& p = *pix;

    if (p.contains("key_types")) {
        cfg.key_types = toml_string_array(p, "key_types");
    }
    cfg.trim_input = p["trim_input"].value_or(true);
    return cfg;
}

BrdocsConfig extract_all_sections(const toml::table& tbl) {
    BrdocsConfig config;
    config.logging = extract_logging(tbl);
    config.pix = extract_pix(tbl);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(BrdocsConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_table(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_table(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const BrdocsConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of debug, info, warn, error; got '{}'",
            config.logging.level));
    }

    if (config.pix.key_types.empty()) {
        errors.push_back("pix.key_types must list at least one key type");
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.pix.key_types.size(); ++i) {
        const auto& name = config.pix.key_types[i];
        if (!parse_pix_key_type(name)) {
            errors.push_back(std::format("pix.key_types[{}]: unknown key type '{}'", i, name));
            continue;
        }
        if (!seen.insert(utils::to_lower(name)).second) {
            errors.push_back(std::format("pix.key_types[{}]: duplicate key type '{}'", i, name));
        }
    }

    return errors;
}

// ============================================================================
// Applying config
// ============================================================================

void apply_logging_config(const LoggingConfig& config) {
    const auto level = utils::log::parse_level(config.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current level", config.level));
        return;
    }
    utils::log::set_level(*level);
}

PixDispatcher make_pix_dispatcher(const PixConfig& config) {
    std::vector<PixKeyType> types;
    types.reserve(config.key_types.size());
    for (const auto& name : config.key_types) {
        if (const auto type = parse_pix_key_type(name)) {
            types.push_back(*type);
        }
    }

    auto dispatcher = PixDispatcher::with_kinds(
        types, PixDispatcher::Options{.trim_input = config.trim_input});
    utils::log::debug(std::format("PIX dispatcher built with {} key kind(s), trim_input={}",
        dispatcher.kind_count(), utils::booltostr(config.trim_input)));
    return dispatcher;
}

} // namespace brdocs
