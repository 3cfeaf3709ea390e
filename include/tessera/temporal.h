#ifndef TESSERA_TEMPORAL_H
#define TESSERA_TEMPORAL_H

#include <cstdint>
#include <optional>
#include <string>
#include "slice.h"

namespace Tessera {

class Status;

/*
 * Time zone with a constant offset from UTC. There are no daylight saving rules. The offset is
 * negative when the sign is '-'.
 */
class FixedOffsetTimeZone final {
public:
    // UTC, rendered as "+00:00".
    FixedOffsetTimeZone() = default;
    FixedOffsetTimeZone(char sign, unsigned hours, unsigned minutes);

    [[nodiscard]] auto is_negative() const -> bool
    {
        return m_negative;
    }

    [[nodiscard]] auto hours() const -> unsigned
    {
        return m_hours;
    }

    [[nodiscard]] auto minutes() const -> unsigned
    {
        return m_minutes;
    }

    // Signed offset from UTC in minutes.
    [[nodiscard]] auto offset_minutes() const -> int;

    [[nodiscard]] auto to_string() const -> std::string;

private:
    bool m_negative {};
    unsigned m_hours {};
    unsigned m_minutes {};
};

auto operator==(const FixedOffsetTimeZone &lhs, const FixedOffsetTimeZone &rhs) -> bool;
auto operator!=(const FixedOffsetTimeZone &lhs, const FixedOffsetTimeZone &rhs) -> bool;

struct Date {
    unsigned year {1};
    unsigned month {1};
    unsigned day {1};

    // Format as "YYYY-MM-DD".
    [[nodiscard]] auto to_string() const -> std::string;
};

struct Time {
    unsigned hour {};
    unsigned minute {};
    unsigned second {};
    unsigned microsecond {};
    std::optional<FixedOffsetTimeZone> zone;

    // Format as "HH:MM:SS[.ffffff][+HH:MM]". The fraction is only written when it is non-zero.
    [[nodiscard]] auto to_string() const -> std::string;
};

struct Timestamp {
    Date date;
    Time time;

    [[nodiscard]] auto to_string() const -> std::string;
};

// Comparison is structural. Two times with different zones are not equal, even if they denote the same instant.
auto operator==(const Date &lhs, const Date &rhs) -> bool;
auto operator!=(const Date &lhs, const Date &rhs) -> bool;
auto operator==(const Time &lhs, const Time &rhs) -> bool;
auto operator!=(const Time &lhs, const Time &rhs) -> bool;
auto operator==(const Timestamp &lhs, const Timestamp &rhs) -> bool;
auto operator!=(const Timestamp &lhs, const Timestamp &rhs) -> bool;

[[nodiscard]] auto is_leap_year(unsigned year) -> bool;
[[nodiscard]] auto days_in_month(unsigned year, unsigned month) -> unsigned;

/*
 * Literal parsers. Leading and trailing whitespace is ignored. The grammars are fixed:
 *     Date:      YYYY-MM-DD
 *     Time:      HH:MM:SS[.f{1,6}][(+|-)HH:MM]
 *     Timestamp: <Date> <Time>
 * A fraction with fewer than 6 digits is right-padded with zeros ("5" is 500000 microseconds).
 * Out-of-range fields are rejected. Failures are reported as invalid_date, invalid_time, and
 * invalid_timestamp, respectively.
 */
[[nodiscard]] auto parse_date(const Slice &text, Date &out) -> Status;
[[nodiscard]] auto parse_time(const Slice &text, Time &out) -> Status;
[[nodiscard]] auto parse_timestamp(const Slice &text, Timestamp &out) -> Status;

// Convert milliseconds since the Unix epoch to a UTC timestamp without a zone.
[[nodiscard]] auto timestamp_from_epoch_ms(std::int64_t ms) -> Timestamp;

} // namespace Tessera

#endif // TESSERA_TEMPORAL_H
