#include <gtest/gtest.h>
#include "harness.h"
#include "tessera/period.h"

namespace {

using namespace Tessera;

TEST(PeriodTests, ParsesDatePeriod)
{
    AnyPeriod period;
    ASSERT_OK(parse_period("PERIOD(DATE)", "('2020-01-01', '2020-12-31')", period));
    ASSERT_TRUE(std::holds_alternative<DatePeriod>(period));
    const auto &dates = std::get<DatePeriod>(period);
    ASSERT_EQ(dates.start, (Date {2020, 1, 1}));
    ASSERT_EQ(dates.end, (Date {2020, 12, 31}));
    ASSERT_EQ(dates.to_string(), "('2020-01-01', '2020-12-31')");
}

TEST(PeriodTests, ParsesTimePeriod)
{
    AnyPeriod period;
    ASSERT_OK(parse_period("PERIOD(TIME(6) WITH TIME ZONE)", "('08:00:00.5+01:00','17:30:00+01:00')", period));
    ASSERT_TRUE(std::holds_alternative<TimePeriod>(period));
    const auto &times = std::get<TimePeriod>(period);
    ASSERT_EQ(times.start.microsecond, 500'000);
    ASSERT_EQ(times.start.zone->offset_minutes(), 60);
    ASSERT_EQ(times.to_string(), "('08:00:00.500000+01:00', '17:30:00+01:00')");
}

TEST(PeriodTests, ParsesTimestampPeriod)
{
    AnyPeriod period;
    ASSERT_OK(parse_period("PERIOD(TIMESTAMP(0))", "('2020-01-01 00:00:00', '2021-01-01 12:00:00-05:00')", period));
    ASSERT_TRUE(std::holds_alternative<TimestampPeriod>(period));
    const auto &timestamps = std::get<TimestampPeriod>(period);
    ASSERT_FALSE(timestamps.start.time.zone.has_value());
    ASSERT_EQ(timestamps.end.time.zone->offset_minutes(), -300);

    TimestampPeriod other;
    ASSERT_OK(parse_timestamp("2020-01-01 00:00:00", other.start));
    ASSERT_OK(parse_timestamp("2021-01-01 12:00:00-05:00", other.end));
    ASSERT_EQ(timestamps, other);
    other.end.time.zone.reset();
    ASSERT_NE(timestamps, other);
}

TEST(PeriodTests, IgnoresTextAfterTheLiteral)
{
    AnyPeriod period;
    ASSERT_OK(parse_period("PERIOD(DATE)", "('2020-01-01', '2020-12-31') trailing", period));
    ASSERT_EQ(std::get<DatePeriod>(period).end, (Date {2020, 12, 31}));
}

TEST(PeriodTests, RejectsMalformedLiteral)
{
    AnyPeriod period;
    for (const auto *text: {"", "2020-01-01, 2020-12-31", "('2020-01-01')", " ('2020-01-01', '2020-12-31')",
                            "(2020-01-01, 2020-12-31)"}) {
        ASSERT_CODE(parse_period("PERIOD(DATE)", text, period), INVALID_PERIOD) << text;
    }
    const auto s = parse_period("PERIOD(DATE)", "(x)", period);
    ASSERT_EQ(s.what().to_string(), "PERIOD(DATE) format invalid: (x)");
}

TEST(PeriodTests, RejectsUnknownElementType)
{
    AnyPeriod period;
    const auto s = parse_period("PERIOD(INTEGER)", "('1', '2')", period);
    ASSERT_CODE(s, INVALID_PERIOD);
    ASSERT_EQ(s.what().to_string(), "Unknown PERIOD data type: PERIOD(INTEGER)");
}

TEST(PeriodTests, BoundErrorsAreReportedAsPeriodErrors)
{
    AnyPeriod period;
    auto s = parse_period("PERIOD(DATE)", "('2020-01-01', '2020-02-30')", period);
    ASSERT_CODE(s, INVALID_PERIOD);
    ASSERT_EQ(s.what().to_string(), "Date format invalid: 2020-02-30");

    s = parse_period("PERIOD(TIME)", "('25:00:00', '10:00:00')", period);
    ASSERT_CODE(s, INVALID_PERIOD);
    ASSERT_EQ(s.what().to_string(), "Time format invalid: 25:00:00");

    s = parse_period("PERIOD(TIMESTAMP)", "('2020-01-01', '2020-01-02')", period);
    ASSERT_CODE(s, INVALID_PERIOD);
}

} // namespace
