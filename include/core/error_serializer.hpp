#pragma once

#include "core/error.hpp"

#include <string>

namespace brdocs {

/// {"code":"...","document_type":"...","message":"..."}
[[nodiscard]] std::string to_json(const ValidationError& error);

/// {"message":"...","extensions":{"code":"...","document_type":"..."}}
[[nodiscard]] std::string to_graphql_error(const ValidationError& error);

} // namespace brdocs
