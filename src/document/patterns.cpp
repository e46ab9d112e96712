#include "document/patterns.hpp"

namespace brdocs::patterns {

const std::regex& cpf() {
    static const std::regex re(R"(^\d{3}\.?\d{3}\.?\d{3}-?\d{2}$)");
    return re;
}

const std::regex& cnpj() {
    static const std::regex re(R"(^\d{2}\.?\d{3}\.?\d{3}/?\d{4}-?\d{2}$)");
    return re;
}

const std::regex& cep() {
    static const std::regex re(R"(^\d{5}-?\d{3}$)");
    return re;
}

const std::regex& phone() {
    static const std::regex re(R"(^(\+55\s?)?(\(?\d{2}\)?\s?)?(\d{4,5}[-\s]?\d{4})$)");
    return re;
}

const std::regex& email() {
    static const std::regex re(R"(^[a-zA-Z0-9._%+-]+@[a-zA-Z0-9.-]+\.[a-zA-Z]{2,}$)");
    return re;
}

const std::regex& pix_phone() {
    static const std::regex re(R"(^\+55\d{11}$)");
    return re;
}

const std::regex& random_key() {
    static const std::regex re(
        R"(^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$)");
    return re;
}

} // namespace brdocs::patterns
