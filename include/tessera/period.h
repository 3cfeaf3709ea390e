#ifndef TESSERA_PERIOD_H
#define TESSERA_PERIOD_H

#include <variant>
#include "temporal.h"

namespace Tessera {

template<class T>
struct Period {
    T start;
    T end;

    // Format as "('<start>', '<end>')".
    [[nodiscard]] auto to_string() const -> std::string
    {
        return "('" + start.to_string() + "', '" + end.to_string() + "')";
    }
};

template<class T>
auto operator==(const Period<T> &lhs, const Period<T> &rhs) -> bool
{
    return lhs.start == rhs.start && lhs.end == rhs.end;
}

template<class T>
auto operator!=(const Period<T> &lhs, const Period<T> &rhs) -> bool
{
    return !(lhs == rhs);
}

using DatePeriod = Period<Date>;
using TimePeriod = Period<Time>;
using TimestampPeriod = Period<Timestamp>;
using AnyPeriod = std::variant<DatePeriod, TimePeriod, TimestampPeriod>;

/*
 * Parse a period literal of the form ('start', 'end'). The element type is chosen from "type_name": a
 * name containing "TIMESTAMP" yields a TimestampPeriod, then "TIME" a TimePeriod, then "DATE" a
 * DatePeriod. All failures are reported as invalid_period.
 */
[[nodiscard]] auto parse_period(const Slice &type_name, const Slice &text, AnyPeriod &out) -> Status;

} // namespace Tessera

#endif // TESSERA_PERIOD_H
