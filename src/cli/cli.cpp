#include "cli/cli.hpp"
#include "core/error_serializer.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "document/document_kind.hpp"
#include "pix/pix_dispatcher.hpp"

#include <format>
#include <optional>
#include <string>

namespace brdocs::cli {

namespace {

enum class Command { VALIDATE, FORMAT, MASK, NORMALIZE, CHECK, DETECT };

std::optional<Command> parse_command(std::string_view name) {
    if (name == "validate")  return Command::VALIDATE;
    if (name == "format")    return Command::FORMAT;
    if (name == "mask")      return Command::MASK;
    if (name == "normalize") return Command::NORMALIZE;
    if (name == "check")     return Command::CHECK;
    if (name == "detect")    return Command::DETECT;
    return std::nullopt;
}

/// Output sinks for one invocation
class Session {
public:
    Session(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    int usage(std::string_view reason = {}) {
        if (!reason.empty()) {
            err_ << "brdocs: " << reason << "\n";
        }
        err_ <<
            "usage: brdocs [--config FILE] <validate|format|mask|normalize|check> "
            "<cpf|cnpj|cep|phone|pix> <value>\n"
            "       brdocs [--config FILE] detect <value>\n";
        return kExitUsage;
    }

    int report_error(const ValidationError& error) {
        utils::log::debug(std::format("Rejected input: {}", error.code()));
        out_ << to_json(error) << "\n";
        return kExitInvalid;
    }

    int print_line(std::string_view text) {
        out_ << text << "\n";
        return kExitOk;
    }

    int run_document(Command command, DocumentKind kind, std::string_view value) {
        switch (command) {
            case Command::VALIDATE: {
                const auto result = validate_document(kind, value);
                return result.is_ok() ? print_line(result.value()) : report_error(result.error());
            }
            case Command::FORMAT:    return print_line(format_document(kind, value));
            case Command::MASK:      return print_line(mask_document(kind, value));
            case Command::NORMALIZE: return print_line(normalize_document(kind, value));
            case Command::CHECK: {
                const bool ok = is_document_format(kind, value);
                out_ << utils::booltostr(ok) << "\n";
                return ok ? kExitOk : kExitInvalid;
            }
            case Command::DETECT:
                break;
        }
        return usage("detect takes only a value");
    }

    int run_pix(Command command, const PixDispatcher& dispatcher, std::string_view value) {
        switch (command) {
            case Command::VALIDATE: {
                const auto result = dispatcher.validate_with_type(value);
                if (result.is_error()) return report_error(result.error());
                return print_line(std::format("{} {}",
                    pix_key_type_name(result.value().type), result.value().value));
            }
            case Command::MASK:      return print_line(dispatcher.mask(value));
            case Command::NORMALIZE: return print_line(dispatcher.normalize(value));
            case Command::CHECK:
            case Command::DETECT: {
                const auto type = dispatcher.detect_type(value);
                if (!type) {
                    return report_error(ValidationError::invalid_pix_key("formato não reconhecido"));
                }
                return print_line(pix_key_type_name(*type));
            }
            case Command::FORMAT:
                break;
        }
        return usage("format is not defined for PIX keys");
    }

private:
    std::ostream& out_;
    std::ostream& err_;
};

} // anonymous namespace

int run(std::span<const std::string_view> args, std::ostream& out, std::ostream& err) {
    Session session(out, err);

    BrdocsConfig config;
    if (args.size() >= 2 && args[0] == "--config") {
        const std::string config_file(args[1]);
        args = args.subspan(2);

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitUsage;
        }
        config = std::move(config_result.config);
        apply_logging_config(config.logging);
        utils::log::debug(std::format("Configuration loaded from {}", config_file));
    }

    if (args.empty()) {
        return session.usage();
    }

    const auto command = parse_command(args[0]);
    if (!command) {
        return session.usage(std::format("unknown command '{}'", args[0]));
    }

    const auto dispatcher = make_pix_dispatcher(config.pix);

    if (*command == Command::DETECT) {
        if (args.size() != 2) return session.usage();
        return session.run_pix(Command::DETECT, dispatcher, args[1]);
    }

    if (args.size() != 3) {
        return session.usage();
    }

    const std::string_view kind_name = args[1];
    const std::string_view value = args[2];

    if (utils::to_lower(kind_name) == "pix") {
        return session.run_pix(*command, dispatcher, value);
    }

    const auto kind = parse_document_kind(kind_name);
    if (!kind) {
        return session.usage(std::format("unknown document kind '{}'", kind_name));
    }
    return session.run_document(*command, *kind, value);
}

} // namespace brdocs::cli
