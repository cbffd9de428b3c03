#pragma once

#include <cstddef>
#include <string_view>

/// @file include/nanp/constants.hpp
/// @brief Fixed values of the North American Numbering Plan normalizer.

namespace nanp::constants {

// ─── Sentinel ─────────────────────────────────────────────────────────────────

/// Canonical value returned for any input that fails validation.
/// Indistinguishable from a number that really is all zeros; use
/// nanp::phone::parse() when the caller needs to tell the two apart.
static constexpr std::string_view INVALID_NUMBER = "0000000000";

// ─── Layout ───────────────────────────────────────────────────────────────────

/// Length of a canonical number: area code + exchange + subscriber.
static constexpr std::size_t NUMBER_LENGTH = 10;

static constexpr std::size_t AREA_CODE_LENGTH  = 3;
static constexpr std::size_t EXCHANGE_LENGTH   = 3;
static constexpr std::size_t SUBSCRIBER_LENGTH = 4;

static constexpr std::size_t EXCHANGE_OFFSET   = AREA_CODE_LENGTH;
static constexpr std::size_t SUBSCRIBER_OFFSET = AREA_CODE_LENGTH + EXCHANGE_LENGTH;

// ─── Country Code ─────────────────────────────────────────────────────────────

/// The only recognized country code (NANP trunk prefix).
static constexpr std::string_view COUNTRY_CODE = "1";

/// Country code written in international notation.
static constexpr std::string_view INTL_COUNTRY_CODE = "+1";

static_assert(AREA_CODE_LENGTH + EXCHANGE_LENGTH + SUBSCRIBER_LENGTH == NUMBER_LENGTH);
static_assert(INVALID_NUMBER.size() == NUMBER_LENGTH);

} // namespace nanp::constants
