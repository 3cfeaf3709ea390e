#include "tessera/temporal.h"
#include <regex>
#include <spdlog/fmt/fmt.h>
#include "tessera/status.h"
#include "utils/logging.h"
#include "utils/utils.h"

namespace Tessera {

static constexpr auto DATE_PATTERN = R"((\d{4})-(\d{2})-(\d{2}))";
static constexpr auto TIME_PATTERN = R"((\d{2}):(\d{2}):(\d{2})(\.(\d{1,6}))?(([-+])(\d{2}):(\d{2}))?)";

// Parse a run of at most 9 digits that has already been matched by a pattern.
static auto to_unsigned(const std::string &digits) -> unsigned
{
    TESSERA_EXPECT_LE(digits.size(), 9);
    unsigned value {};
    for (const auto c: digits) {
        value = value * 10 + static_cast<unsigned>(c - '0');
    }
    return value;
}

FixedOffsetTimeZone::FixedOffsetTimeZone(char sign, unsigned hours, unsigned minutes)
    : m_negative {sign == '-'},
      m_hours {hours},
      m_minutes {minutes}
{
    TESSERA_EXPECT_TRUE(sign == '-' || sign == '+');
}

auto FixedOffsetTimeZone::offset_minutes() const -> int
{
    const auto total = static_cast<int>(m_hours * 60 + m_minutes);
    return m_negative ? -total : total;
}

auto FixedOffsetTimeZone::to_string() const -> std::string
{
    return fmt::format("{}{:02}:{:02}", m_negative ? '-' : '+', m_hours, m_minutes);
}

auto operator==(const FixedOffsetTimeZone &lhs, const FixedOffsetTimeZone &rhs) -> bool
{
    return lhs.offset_minutes() == rhs.offset_minutes();
}

auto operator!=(const FixedOffsetTimeZone &lhs, const FixedOffsetTimeZone &rhs) -> bool
{
    return !(lhs == rhs);
}

auto Date::to_string() const -> std::string
{
    return fmt::format("{:04}-{:02}-{:02}", year, month, day);
}

auto Time::to_string() const -> std::string
{
    auto out = fmt::format("{:02}:{:02}:{:02}", hour, minute, second);
    if (microsecond) {
        out += fmt::format(".{:06}", microsecond);
    }
    if (zone) {
        out += zone->to_string();
    }
    return out;
}

auto Timestamp::to_string() const -> std::string
{
    return date.to_string() + ' ' + time.to_string();
}

auto operator==(const Date &lhs, const Date &rhs) -> bool
{
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

auto operator!=(const Date &lhs, const Date &rhs) -> bool
{
    return !(lhs == rhs);
}

auto operator==(const Time &lhs, const Time &rhs) -> bool
{
    return lhs.hour == rhs.hour && lhs.minute == rhs.minute && lhs.second == rhs.second &&
           lhs.microsecond == rhs.microsecond && lhs.zone == rhs.zone;
}

auto operator!=(const Time &lhs, const Time &rhs) -> bool
{
    return !(lhs == rhs);
}

auto operator==(const Timestamp &lhs, const Timestamp &rhs) -> bool
{
    return lhs.date == rhs.date && lhs.time == rhs.time;
}

auto operator!=(const Timestamp &lhs, const Timestamp &rhs) -> bool
{
    return !(lhs == rhs);
}

auto is_leap_year(unsigned year) -> bool
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

auto days_in_month(unsigned year, unsigned month) -> unsigned
{
    static constexpr unsigned DAYS[] {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    TESSERA_EXPECT_TRUE(month >= 1 && month <= 12);
    return month == 2 && is_leap_year(year) ? 29 : DAYS[month - 1];
}

// Match groups 1 through 3 of DATE_PATTERN, starting at "offset".
static auto make_date(const std::smatch &match, Size offset, Date &out) -> bool
{
    Date date;
    date.year = to_unsigned(match[offset + 1].str());
    date.month = to_unsigned(match[offset + 2].str());
    date.day = to_unsigned(match[offset + 3].str());
    if (date.year < 1 || date.month < 1 || date.month > 12) {
        return false;
    }
    if (date.day < 1 || date.day > days_in_month(date.year, date.month)) {
        return false;
    }
    out = date;
    return true;
}

// Match groups 1 through 9 of TIME_PATTERN, starting at "offset".
static auto make_time(const std::smatch &match, Size offset, Time &out) -> bool
{
    Time time;
    time.hour = to_unsigned(match[offset + 1].str());
    time.minute = to_unsigned(match[offset + 2].str());
    time.second = to_unsigned(match[offset + 3].str());
    if (match[offset + 5].matched) {
        // Right-pad the fraction to microseconds.
        auto fraction = match[offset + 5].str();
        fraction.resize(6, '0');
        time.microsecond = to_unsigned(fraction);
    }
    if (time.hour > 23 || time.minute > 59 || time.second > 59) {
        return false;
    }
    if (match[offset + 6].matched) {
        const auto sign = match[offset + 7].str()[0];
        const auto hours = to_unsigned(match[offset + 8].str());
        const auto minutes = to_unsigned(match[offset + 9].str());
        if (hours > 23 || minutes > 59) {
            return false;
        }
        time.zone = FixedOffsetTimeZone {sign, hours, minutes};
    }
    out = time;
    return true;
}

auto parse_date(const Slice &text, Date &out) -> Status
{
    static const std::regex pattern {std::string {"^"} + DATE_PATTERN + "$"};
    const auto input = strip(text).to_string();
    std::smatch match;
    if (!std::regex_match(input, match, pattern) || !make_date(match, 0, out)) {
        return Status::invalid_date("Date format invalid: " + escape_string(text));
    }
    return Status::ok();
}

auto parse_time(const Slice &text, Time &out) -> Status
{
    static const std::regex pattern {std::string {"^"} + TIME_PATTERN + "$"};
    const auto input = strip(text).to_string();
    std::smatch match;
    if (!std::regex_match(input, match, pattern) || !make_time(match, 0, out)) {
        return Status::invalid_time("Time format invalid: " + escape_string(text));
    }
    return Status::ok();
}

auto parse_timestamp(const Slice &text, Timestamp &out) -> Status
{
    static const std::regex pattern {std::string {"^"} + DATE_PATTERN + " " + TIME_PATTERN + "$"};
    const auto input = strip(text).to_string();
    std::smatch match;
    Timestamp timestamp;
    if (!std::regex_match(input, match, pattern) ||
        !make_date(match, 0, timestamp.date) ||
        !make_time(match, 3, timestamp.time)) {
        return Status::invalid_timestamp("Timestamp format invalid: " + escape_string(text));
    }
    out = timestamp;
    return Status::ok();
}

auto timestamp_from_epoch_ms(std::int64_t ms) -> Timestamp
{
    static constexpr std::int64_t MS_PER_DAY {86'400'000};
    auto days = ms / MS_PER_DAY;
    auto remainder = ms % MS_PER_DAY;
    if (remainder < 0) {
        remainder += MS_PER_DAY;
        --days;
    }

    // Convert days since 1970-01-01 to a civil date. Algorithm from Howard Hinnant's "chrono-Compatible
    // Low-Level Date Algorithms".
    days += 719'468;
    const auto era = (days >= 0 ? days : days - 146'096) / 146'097;
    const auto doe = days - era * 146'097;
    const auto yoe = (doe - doe / 1'460 + doe / 36'524 - doe / 146'096) / 365;
    const auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const auto mp = (5 * doy + 2) / 153;
    const auto day = doy - (153 * mp + 2) / 5 + 1;
    const auto month = mp < 10 ? mp + 3 : mp - 9;
    const auto year = yoe + era * 400 + (month <= 2);

    Timestamp out;
    out.date.year = static_cast<unsigned>(year);
    out.date.month = static_cast<unsigned>(month);
    out.date.day = static_cast<unsigned>(day);
    out.time.hour = static_cast<unsigned>(remainder / 3'600'000);
    out.time.minute = static_cast<unsigned>(remainder / 60'000 % 60);
    out.time.second = static_cast<unsigned>(remainder / 1'000 % 60);
    out.time.microsecond = static_cast<unsigned>(remainder % 1'000 * 1'000);
    return out;
}

} // namespace Tessera
