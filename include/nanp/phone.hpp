#pragma once

/// @file include/nanp/phone.hpp
/// @brief Normalization, validation and formatting of free-form NANP numbers.
///
/// # Module: Phone Normalizer
///
/// ## Responsibility
/// Turn untrusted text such as "+1 (303) 555-1212" into a canonical
/// 10-character number and derive the area code and display form from it.
///
/// ## Pipeline
///   1. Delete '(', ')', '-', '.' and whitespace; everything else is kept
///   2. Any ASCII letter left over → invalid
///   3. Branch on the cleaned length:
///        10 → returned as is
///        11 → leading "1" dropped, otherwise invalid
///        12 → leading "+1" dropped, otherwise invalid
///        *  → invalid
///
/// Invalid input maps to constants::INVALID_NUMBER ("0000000000").
///
/// ## Edge Cases
/// - Letters invalidate before the length is looked at, so "1800FLOWERS"
///   is invalid even though it has eleven characters.
/// - At length 10 only letters are rejected: "303555121#" comes back as is.
///   parse() is the strict alternative that also requires digits.
///
/// ## Guarantees
/// - canonicalize() always returns exactly 10 bytes
/// - area_code() and pretty() are pure functions of canonicalize()
/// - No I/O, no shared state; safe to call concurrently

#include "nanp/constants.hpp"
#include "nanp/phone_number.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace nanp::phone {

/// Canonical 10-character form of `raw`, or constants::INVALID_NUMBER.
[[nodiscard]] std::string canonicalize(std::string_view raw) noexcept;

/// Same as canonicalize().
[[nodiscard]] inline std::string number(std::string_view raw) noexcept {
    return canonicalize(raw);
}

/// First three characters of canonicalize(raw); "000" for invalid input.
[[nodiscard]] std::string area_code(std::string_view raw) noexcept;

/// canonicalize(raw) laid out as "(AAA) EEE-SSSS";
/// "(000) 000-0000" for invalid input.
[[nodiscard]] std::string pretty(std::string_view raw);

/// Strict variant of canonicalize().
///
/// # Returns
/// - `nullopt` wherever canonicalize() would return the sentinel because
///   validation failed, and additionally when the resolved ten characters
///   are not all ASCII digits
/// - `PhoneNumber` otherwise; "000-000-0000" parses to a real all-zero number
[[nodiscard]] std::optional<PhoneNumber> parse(std::string_view raw) noexcept;

} // namespace nanp::phone
