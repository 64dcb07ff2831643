#ifndef ESQ_DATEPARSER_HPP
#define ESQ_DATEPARSER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace esq {
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * Parses a human-readable date/time on a best-effort basis. Accepted forms:
 * - "now"
 * - unix epoch in seconds (10 digits), milliseconds (13 digits) or nanoseconds (19 digits)
 * - "YYYY-MM-DD" or "YYYY/MM/DD", optionally followed by 'T' or spaces and a time of day
 * - "Mon DD[,] YYYY" and "DD Mon YYYY" (English month names), optionally followed by a time
 * - a time of day alone, which refers to the current day
 * - "N <unit>[s] ago" with unit one of second, minute, hour, day, week (or s, m, h, d, w)
 *
 * A time of day is "HH:MM[:SS[.fraction]]" optionally followed by "am"/"pm", and may carry a
 * zone: "Z", "UTC", "GMT", "+HH:MM", "+HHMM" or "+HH" (or '-'). Times without a zone are UTC.
 * @param input
 * @param now The reference point for "now", relative expressions and time-only inputs
 * @return The parsed point in time, or std::nullopt if the input isn't understood
 */
[[nodiscard]] auto parse_datetime(std::string_view input, Timestamp now)
        -> std::optional<Timestamp>;

/**
 * Same as above, relative to the system clock.
 */
[[nodiscard]] auto parse_datetime(std::string_view input) -> std::optional<Timestamp>;

/**
 * @param timestamp
 * @return `timestamp` in RFC3339 form with a "+00:00" offset, e.g. "2024-01-01T00:00:00+00:00".
 * Sub-second precision is printed as milliseconds or microseconds only when non-zero.
 */
[[nodiscard]] auto format_rfc3339(Timestamp timestamp) -> std::string;
}  // namespace esq

#endif  // ESQ_DATEPARSER_HPP
