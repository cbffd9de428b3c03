#pragma once

/// @file src/phone/cleaner.hpp
/// @brief Formatting-character filter used by the phone normalizer.
///
/// # Module: Cleaner
///
/// ## Responsibility
/// Delete a fixed character class from raw input and scan what is left for
/// ASCII letters. The filter does not parse structure: "(30)3-5.55" and
/// "303555" clean to the same string.
///
/// ## Character Classes
/// - Formatting: '(', ')', '-', '.', and whitespace
///   (' ', '\t', '\n', '\v', '\f', '\r')
/// - Letter: 'A'..'Z', 'a'..'z' (ASCII only; bytes >= 0x80 are never letters)
///
/// ## NOT Responsible For
/// - Length or country-code checks (see phone.cpp)
/// - Rejecting symbols such as '#', '*' or '+'

#include <string>
#include <string_view>

namespace nanp::phone {

class Cleaner {
public:
    Cleaner() = delete;

    /// True for the bytes strip() deletes.
    [[nodiscard]] static constexpr bool is_formatting(char c) noexcept {
        switch (c) {
            case '(': case ')': case '-': case '.':
            case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
                return true;
            default:
                return false;
        }
    }

    [[nodiscard]] static constexpr bool is_ascii_letter(char c) noexcept {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
    }

    [[nodiscard]] static constexpr bool is_ascii_digit(char c) noexcept {
        return c >= '0' && c <= '9';
    }

    /// `raw` with every formatting byte removed, other bytes in order.
    [[nodiscard]] static std::string strip(std::string_view raw);

    /// True if any byte of `s` is an ASCII letter.
    [[nodiscard]] static bool contains_letter(std::string_view s) noexcept;

    /// True if `s` is non-empty and every byte is an ASCII digit.
    [[nodiscard]] static bool all_digits(std::string_view s) noexcept;
};

} // namespace nanp::phone
