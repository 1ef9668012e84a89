/// @file fracindex.hpp
/// @brief Umbrella header for the fracindex-cpp library.
///
/// Include this single header for access to all public types:
/// Digits, KeyParts, Error, OrderKeyError and the key generation functions.
/// JSON interoperability lives separately in json.hpp.

#pragma once

#include <fracindex-cpp/digits.hpp>
#include <fracindex-cpp/error.hpp>
#include <fracindex-cpp/key.hpp>
#include <fracindex-cpp/logging.hpp>
