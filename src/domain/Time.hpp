/**
 * @file Time.hpp
 * @brief Millisecond timestamps as used by the remote API and the archive format.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace chatvault::domain {

/// Unix time in milliseconds.
using Timestamp = std::int64_t;

/**
 * @brief Parses an ISO-8601 date or date-time ("2021-03-01", "2021-03-01T10:20:30").
 *
 * Values without an explicit offset are read as UTC.
 * @return std::nullopt if the text is not a recognised date.
 */
std::optional<Timestamp> ParseIsoTime(const std::string& text);

/** @brief Formats a timestamp as "YYYY-MM-DDTHH:MM:SS" (UTC). */
std::string FormatIsoTime(Timestamp time);

} // namespace chatvault::domain
