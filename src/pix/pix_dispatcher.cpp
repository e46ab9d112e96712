#include "pix/pix_dispatcher.hpp"
#include "pix/pix_key_kinds.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>

namespace brdocs {

namespace {

constexpr std::array kCanonicalOrder = {
    PixKeyType::CPF,
    PixKeyType::CNPJ,
    PixKeyType::EMAIL,
    PixKeyType::PHONE,
    PixKeyType::RANDOM,
};

} // anonymous namespace

void PixDispatcher::add_kind(std::shared_ptr<const IPixKeyKind> kind) {
    if (!kind) return;
    kinds_.push_back(std::move(kind));
}

PixDispatcher PixDispatcher::with_default_kinds(Options options) {
    return with_kinds(std::vector<PixKeyType>(kCanonicalOrder.begin(), kCanonicalOrder.end()), options);
}

PixDispatcher PixDispatcher::with_kinds(
    const std::vector<PixKeyType>& types, Options options) {

    PixDispatcher dispatcher(options);
    for (const auto type : kCanonicalOrder) {
        if (std::find(types.begin(), types.end(), type) != types.end()) {
            dispatcher.add_kind(make_pix_key_kind(type));
        }
    }
    return dispatcher;
}

std::string_view PixDispatcher::prepare(std::string_view key) const {
    return options_.trim_input ? utils::trim(key) : key;
}

const IPixKeyKind* PixDispatcher::match(std::string_view key) const {
    const auto prepared = prepare(key);
    // Recognizers run std::regex, whose matcher recurses per character
    if (prepared.size() > kMaxKeyLength) {
        return nullptr;
    }
    for (const auto& kind : kinds_) {
        if (kind->matches(prepared)) {
            return kind.get();
        }
    }
    return nullptr;
}

Result<void> PixDispatcher::validate(std::string_view key) const {
    const auto result = validate_with_type(key);
    if (result.is_error()) {
        return Result<void>::error(result.error());
    }
    return Result<void>::ok();
}

std::optional<PixKeyType> PixDispatcher::detect_type(std::string_view key) const {
    const auto* kind = match(key);
    if (!kind) return std::nullopt;
    return kind->type();
}

Result<PixKeyClassification> PixDispatcher::validate_with_type(std::string_view key) const {
    const auto prepared = prepare(key);
    const auto* kind = match(prepared);
    if (!kind) {
        return Result<PixKeyClassification>::error(
            ValidationError::invalid_pix_key("formato não reconhecido"));
    }

    auto validated = kind->validate(prepared);
    if (validated.is_error()) {
        return Result<PixKeyClassification>::error(validated.error());
    }
    return Result<PixKeyClassification>::ok(
        PixKeyClassification{kind->type(), std::move(validated.value())});
}

std::string PixDispatcher::normalize(std::string_view key) const {
    const auto prepared = prepare(key);
    const auto* kind = match(prepared);
    return kind ? kind->normalize(prepared) : std::string(prepared);
}

std::string PixDispatcher::mask(std::string_view key) const {
    const auto prepared = prepare(key);
    const auto* kind = match(prepared);
    return kind ? kind->mask(prepared) : std::string(prepared);
}

std::vector<PixKeyType> PixDispatcher::kind_types() const {
    std::vector<PixKeyType> types;
    types.reserve(kinds_.size());
    for (const auto& kind : kinds_) {
        types.push_back(kind->type());
    }
    return types;
}

} // namespace brdocs
