/// @file src/phone/phone.cpp
/// @brief NANP normalizer: canonicalize, area_code, pretty, parse.
///
/// canonicalize() and parse() share one resolution step:
///   1. Cleaner::strip() the raw input
///   2. reject on any ASCII letter
///   3. switch on the cleaned length and drop a "1" / "+1" country code
/// canonicalize() maps a failed resolution to the sentinel; parse() maps it
/// to nullopt and also rejects non-digit results.

#include "nanp/phone.hpp"

#include "cleaner.hpp"

#include <fmt/format.h>

namespace nanp::phone {

namespace {

constexpr std::size_t PREFIXED_LENGTH      = constants::COUNTRY_CODE.size()
                                           + constants::NUMBER_LENGTH;
constexpr std::size_t INTL_PREFIXED_LENGTH = constants::INTL_COUNTRY_CODE.size()
                                           + constants::NUMBER_LENGTH;

/// Strip the country code from `cleaned` if it carries `prefix`.
std::optional<std::string_view>
drop_country_code(std::string_view cleaned, std::string_view prefix) noexcept {
    if (cleaned.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }
    return cleaned.substr(prefix.size());
}

/// The ten canonical characters inside `cleaned`, or nullopt if invalid.
/// The returned view points into `cleaned`.
std::optional<std::string_view> resolve(std::string_view cleaned) noexcept {
    if (Cleaner::contains_letter(cleaned)) {
        return std::nullopt;
    }

    switch (cleaned.size()) {
        case constants::NUMBER_LENGTH:
            return cleaned;
        case PREFIXED_LENGTH:
            return drop_country_code(cleaned, constants::COUNTRY_CODE);
        case INTL_PREFIXED_LENGTH:
            return drop_country_code(cleaned, constants::INTL_COUNTRY_CODE);
        default:
            return std::nullopt;
    }
}

} // namespace

// ─── canonicalize ─────────────────────────────────────────────────────────────

std::string canonicalize(std::string_view raw) noexcept {
    const std::string cleaned = Cleaner::strip(raw);
    return std::string(resolve(cleaned).value_or(constants::INVALID_NUMBER));
}

// ─── Derived views ────────────────────────────────────────────────────────────

std::string area_code(std::string_view raw) noexcept {
    return canonicalize(raw).substr(0, constants::AREA_CODE_LENGTH);
}

std::string pretty(std::string_view raw) {
    const std::string c = canonicalize(raw);
    const std::string_view v(c);
    return fmt::format("({}) {}-{}",
                       v.substr(0, constants::AREA_CODE_LENGTH),
                       v.substr(constants::EXCHANGE_OFFSET, constants::EXCHANGE_LENGTH),
                       v.substr(constants::SUBSCRIBER_OFFSET, constants::SUBSCRIBER_LENGTH));
}

// ─── parse ────────────────────────────────────────────────────────────────────

std::optional<PhoneNumber> parse(std::string_view raw) noexcept {
    const std::string cleaned = Cleaner::strip(raw);
    const auto canonical = resolve(cleaned);
    if (!canonical) {
        return std::nullopt;
    }
    // make() rejects the '#' / '*' / '+' residue canonicalize() lets through.
    return PhoneNumber::make(*canonical);
}

} // namespace nanp::phone
