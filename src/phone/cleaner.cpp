/// @file src/phone/cleaner.cpp
/// @brief Formatting-character filter and letter scan.

#include "cleaner.hpp"

#include <algorithm>
#include <iterator>

namespace nanp::phone {

std::string Cleaner::strip(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    std::copy_if(raw.begin(), raw.end(), std::back_inserter(out),
                 [](char c) { return !is_formatting(c); });
    return out;
}

bool Cleaner::contains_letter(std::string_view s) noexcept {
    return std::any_of(s.begin(), s.end(), is_ascii_letter);
}

bool Cleaner::all_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(), is_ascii_digit);
}

} // namespace nanp::phone
