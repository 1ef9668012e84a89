/// @file json.hpp
/// @brief nlohmann/json interoperability for fracindex-cpp.
///
/// Provides ADL serialization (to_json/from_json) for errors, key parts and
/// digit alphabets, and a loader for alphabet configuration objects.

#pragma once

#include <fracindex-cpp/digits.hpp>
#include <fracindex-cpp/error.hpp>
#include <fracindex-cpp/key.hpp>

#include <nlohmann/json.hpp>

namespace fracindex_cpp {

// -- Errors -------------------------------------------------------------------

void to_json(nlohmann::json& j, ErrorKind kind);
void from_json(const nlohmann::json& j, ErrorKind& kind);

void to_json(nlohmann::json& j, const Error& e);

/// Read an Error back from {"kind": ..., "message": ...}.
/// Error has no default constructor, so this is a factory rather than an
/// ADL from_json overload.
auto error_from_json(const nlohmann::json& j) -> Error;

// -- Keys ---------------------------------------------------------------------

/// {"integer": ..., "fraction": ...}. No from_json: KeyParts only views a key.
void to_json(nlohmann::json& j, const KeyParts& parts);

// -- Digit alphabets ----------------------------------------------------------

/// An alphabet serializes as its characters in order.
void to_json(nlohmann::json& j, const Digits& digits);

/// Parse and validate an alphabet.
/// @throws OrderKeyError (invalid_digits) unless j is a string of at least two
///   strictly ascending characters.
void from_json(const nlohmann::json& j, Digits& digits);

/// Read the alphabet from a configuration object.
///
/// The object's optional "digits" member names the alphabet; when it is
/// absent the default base-62 alphabet is returned.
///
/// @code
/// auto cfg = nlohmann::json::parse(R"({"digits": "0123456789"})");
/// auto digits = load_digits(cfg);
/// @endcode
auto load_digits(const nlohmann::json& config) -> Digits;

}  // namespace fracindex_cpp
