/// @file src/phone/phone_number.cpp
/// @brief PhoneNumber value type.

#include "nanp/phone_number.hpp"
#include "nanp/constants.hpp"

#include "cleaner.hpp"

#include <fmt/format.h>

namespace nanp {

std::optional<PhoneNumber> PhoneNumber::make(std::string_view canonical) noexcept {
    if (canonical.size() != constants::NUMBER_LENGTH ||
        !phone::Cleaner::all_digits(canonical)) {
        return std::nullopt;
    }
    return PhoneNumber{std::string(canonical)};
}

std::string_view PhoneNumber::area_code() const noexcept {
    return digits().substr(0, constants::AREA_CODE_LENGTH);
}

std::string_view PhoneNumber::exchange() const noexcept {
    return digits().substr(constants::EXCHANGE_OFFSET, constants::EXCHANGE_LENGTH);
}

std::string_view PhoneNumber::subscriber() const noexcept {
    return digits().substr(constants::SUBSCRIBER_OFFSET, constants::SUBSCRIBER_LENGTH);
}

std::string PhoneNumber::to_string() const {
    return fmt::format("({}) {}-{}", area_code(), exchange(), subscriber());
}

} // namespace nanp
