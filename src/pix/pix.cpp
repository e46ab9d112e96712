#include "pix/pix.hpp"

namespace brdocs::pix {

const PixDispatcher& default_dispatcher() {
    static const PixDispatcher dispatcher = PixDispatcher::with_default_kinds();
    return dispatcher;
}

Result<void> validate(std::string_view key) {
    return default_dispatcher().validate(key);
}

std::optional<PixKeyType> detect_type(std::string_view key) {
    return default_dispatcher().detect_type(key);
}

Result<PixKeyClassification> validate_with_type(std::string_view key) {
    return default_dispatcher().validate_with_type(key);
}

std::string normalize(std::string_view key) {
    return default_dispatcher().normalize(key);
}

std::string mask(std::string_view key) {
    return default_dispatcher().mask(key);
}

} // namespace brdocs::pix
