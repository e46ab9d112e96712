#include "core/error_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace brdocs {

std::string to_json(const ValidationError& error) {
    return std::format(
        R"({{"code":"{}","document_type":"{}","message":"{}"}})",
        error.code(),
        utils::escape_json(error.document_type()),
        utils::escape_json(error.message()));
}

std::string to_graphql_error(const ValidationError& error) {
    return std::format(
        R"({{"message":"{}","extensions":{{"code":"{}","document_type":"{}"}}}})",
        utils::escape_json(error.message()),
        error.code(),
        utils::escape_json(error.document_type()));
}

} // namespace brdocs
