/**
 * @file InstantFormat.hpp
 * @brief Conversions between absolute instants and their text/storage forms.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "domain/Clock.hpp"

namespace writher::domain {

/**
 * @brief Parses an ISO-8601 date-time into an absolute instant.
 *
 * Accepts "YYYY-MM-DDTHH:MM[:SS[.fff]]" followed by an optional "Z" or
 * "+HH:MM"/"-HH:MM"/"+HHMM" offset. Without an offset the value is read as
 * local time. Date-only values and relative expressions are rejected.
 */
std::optional<Instant> ParseIsoInstant(const std::string& text);

/** @brief "2026-10-19T13:00:00Z". */
std::string FormatIsoUtc(Instant instant);

/** @brief "2026-10-19 15:00" in local time, for user-facing messages. */
std::string FormatLocal(Instant instant);

/** @brief "2026-10-19 15:00 (Monday)" in local time, for the assistant prompt. */
std::string FormatLocalWithWeekday(Instant instant);

std::int64_t ToEpochSeconds(Instant instant);
Instant FromEpochSeconds(std::int64_t seconds);

} // namespace writher::domain
