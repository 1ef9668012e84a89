#include <fracindex-cpp/json.hpp>

#include "raise.hpp"

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fracindex_cpp {

namespace {

constexpr auto all_error_kinds = std::array{
    ErrorKind::invalid_head,
    ErrorKind::invalid_integer_part,
    ErrorKind::invalid_key,
    ErrorKind::ordering_violation,
    ErrorKind::trailing_zero,
    ErrorKind::exhausted,
    ErrorKind::invalid_digits,
};

}  // anonymous namespace

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ErrorKind& kind) {
    const auto name = j.get<std::string>();
    for (auto candidate : all_error_kinds) {
        if (to_string_view(candidate) == name) {
            kind = candidate;
            return;
        }
    }
    throw std::runtime_error{"unknown error kind: " + name};
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", e.kind}, {"message", e.message}};
}

auto error_from_json(const nlohmann::json& j) -> Error {
    if (!j.is_object() || !j.contains("kind")) {
        throw std::runtime_error{"error object must have a \"kind\" member"};
    }
    return Error{j.at("kind").get<ErrorKind>(), j.value("message", std::string{})};
}

// -- Keys ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const KeyParts& parts) {
    j = nlohmann::json{{"integer", std::string{parts.integer}},
                       {"fraction", std::string{parts.fraction}}};
}

// -- Digit alphabets ----------------------------------------------------------

void to_json(nlohmann::json& j, const Digits& digits) {
    j = std::string{digits.chars()};
}

void from_json(const nlohmann::json& j, Digits& digits) {
    if (!j.is_string()) {
        detail::raise(ErrorKind::invalid_digits, "digit alphabet must be a JSON string");
    }
    auto parsed = Digits{j.get<std::string>()};
    if (!parsed.is_strictly_ascending()) {
        detail::raise(ErrorKind::invalid_digits,
                      "digit alphabet is not strictly ascending: " + std::string{parsed.chars()});
    }
    digits = std::move(parsed);
}

auto load_digits(const nlohmann::json& config) -> Digits {
    if (!config.is_object()) {
        throw std::runtime_error{"configuration must be a JSON object"};
    }
    if (!config.contains("digits")) return default_digits();
    return config.at("digits").get<Digits>();
}

}  // namespace fracindex_cpp
