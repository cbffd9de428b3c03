#pragma once

/// @file include/nanp/phone_number.hpp
/// @brief PhoneNumber: validated 10-digit NANP number.
///
/// # Module: Phone Number Value Type
///
/// ## Responsibility
/// Hold a canonical number that is known to be exactly ten ASCII digits and
/// expose its three fixed-offset parts:
///   - area code   [0, 3)
///   - exchange    [3, 6)
///   - subscriber  [6, 10)
///
/// ## Guarantees
/// - Immutable after construction; safe to share across threads
/// - Construction only through make(), which never throws
/// - to_string() always has the shape "(AAA) EEE-SSSS"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace nanp {

/// Validated North American phone number.
class PhoneNumber {
public:
    /// Build from an already canonical string.
    ///
    /// # Returns
    /// - `nullopt` unless `canonical` is exactly 10 ASCII digits
    /// - `PhoneNumber` holding a copy of `canonical` otherwise
    [[nodiscard]] static std::optional<PhoneNumber>
    make(std::string_view canonical) noexcept;

    /// All ten digits.
    [[nodiscard]] std::string_view digits() const noexcept { return digits_; }

    [[nodiscard]] std::string_view area_code()  const noexcept;
    [[nodiscard]] std::string_view exchange()   const noexcept;
    [[nodiscard]] std::string_view subscriber() const noexcept;

    /// "(AAA) EEE-SSSS".
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const PhoneNumber&, const PhoneNumber&) = default;

private:
    explicit PhoneNumber(std::string digits) noexcept
        : digits_(std::move(digits)) {}

    std::string digits_;
};

} // namespace nanp
