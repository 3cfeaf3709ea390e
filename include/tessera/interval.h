#ifndef TESSERA_INTERVAL_H
#define TESSERA_INTERVAL_H

#include <chrono>
#include <optional>
#include <string>
#include "decimal.h"

namespace Tessera {

class Status;

enum class IntervalType {
    YEAR,
    YEAR_TO_MONTH,
    MONTH,
    DAY,
    DAY_TO_HOUR,
    DAY_TO_MINUTE,
    DAY_TO_SECOND,
    HOUR,
    HOUR_TO_MINUTE,
    HOUR_TO_SECOND,
    MINUTE,
    MINUTE_TO_SECOND,
    SECOND,
};

// Get the subtype name, e.g. "DAY TO SECOND".
[[nodiscard]] auto get_interval_type_name(IntervalType type) -> const char *;

/*
 * Look up a subtype by its database type name, e.g. "INTERVAL DAY TO SECOND". Returns a not_found status
 * if the name does not denote an interval subtype.
 */
[[nodiscard]] auto parse_interval_type(const Slice &type_name, IntervalType &out) -> Status;

// Loose set of interval fields. Used to build an interval whose subtype is inferred from the fields that are present.
struct IntervalFields {
    std::optional<Size> years;
    std::optional<Size> months;
    std::optional<Size> days;
    std::optional<Size> hours;
    std::optional<Size> minutes;
    std::optional<Decimal> seconds;
    bool negative {};
};

/*
 * Interval value of one of the 13 database interval subtypes. An interval only carries the fields that
 * are legal for its subtype. Seconds keep every decimal digit they were given.
 */
class Interval final {
public:
    // Zero-length SECOND interval.
    Interval();

    [[nodiscard]] static auto year(Size years, bool negative = false) -> Interval;
    [[nodiscard]] static auto year_to_month(Size years, Size months, bool negative = false) -> Interval;
    [[nodiscard]] static auto month(Size months, bool negative = false) -> Interval;
    [[nodiscard]] static auto day(Size days, bool negative = false) -> Interval;
    [[nodiscard]] static auto day_to_hour(Size days, Size hours, bool negative = false) -> Interval;
    [[nodiscard]] static auto day_to_minute(Size days, Size hours, Size minutes, bool negative = false) -> Interval;
    [[nodiscard]] static auto day_to_second(Size days, Size hours, Size minutes, const Decimal &seconds, bool negative = false) -> Interval;
    [[nodiscard]] static auto hour(Size hours, bool negative = false) -> Interval;
    [[nodiscard]] static auto hour_to_minute(Size hours, Size minutes, bool negative = false) -> Interval;
    [[nodiscard]] static auto hour_to_second(Size hours, Size minutes, const Decimal &seconds, bool negative = false) -> Interval;
    [[nodiscard]] static auto minute(Size minutes, bool negative = false) -> Interval;
    [[nodiscard]] static auto minute_to_second(Size minutes, const Decimal &seconds, bool negative = false) -> Interval;
    [[nodiscard]] static auto second(const Decimal &seconds, bool negative = false) -> Interval;

    /*
     * Build an interval from a loose set of fields. The subtype is decided by which fields are present
     * (a present field may be zero). Missing fields between the first and last present field are set to
     * zero. Fails with an invalid_interval status if no field is present, if a year or month field is
     * combined with a non-zero day, hour, minute, or second field, or if the seconds are negative or not
     * finite.
     */
    [[nodiscard]] static auto from_fields(const IntervalFields &fields, Interval &out) -> Status;

    [[nodiscard]] auto type() const -> IntervalType
    {
        return m_type;
    }

    [[nodiscard]] auto is_negative() const -> bool
    {
        return m_fields.negative;
    }

    [[nodiscard]] auto years() const -> std::optional<Size>
    {
        return m_fields.years;
    }

    [[nodiscard]] auto months() const -> std::optional<Size>
    {
        return m_fields.months;
    }

    [[nodiscard]] auto days() const -> std::optional<Size>
    {
        return m_fields.days;
    }

    [[nodiscard]] auto hours() const -> std::optional<Size>
    {
        return m_fields.hours;
    }

    [[nodiscard]] auto minutes() const -> std::optional<Size>
    {
        return m_fields.minutes;
    }

    [[nodiscard]] auto seconds() const -> const std::optional<Decimal> &
    {
        return m_fields.seconds;
    }

    /*
     * Format the interval in the database literal form, e.g. "-3 04:05:06.5". Years and days are not
     * padded, the other fields are padded to 2 digits. Seconds are rounded to 6 fractional digits and
     * written without trailing zeros.
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /*
     * Get the signed length of a day-time interval. Year-month intervals have no fixed length, so a
     * not_supported status is returned for them.
     */
    [[nodiscard]] auto to_duration(std::chrono::microseconds &out) const -> Status;

private:
    Interval(IntervalType type, IntervalFields fields);

    IntervalType m_type {};
    IntervalFields m_fields;
};

auto operator==(const Interval &lhs, const Interval &rhs) -> bool;
auto operator!=(const Interval &lhs, const Interval &rhs) -> bool;

/*
 * Parse an interval literal of the subtype named by "type_name", e.g. parse_interval("INTERVAL DAY TO
 * MINUTE", "-5 10:30", out). Surrounding whitespace is ignored. Returns not_found if "type_name" is not an
 * interval type, and invalid_interval if the literal does not match the subtype's format.
 */
[[nodiscard]] auto parse_interval(const Slice &type_name, const Slice &text, Interval &out) -> Status;
[[nodiscard]] auto parse_interval(IntervalType type, const Slice &text, Interval &out) -> Status;

} // namespace Tessera

#endif // TESSERA_INTERVAL_H
