#include "tessera/interval.h"
#include <iterator>
#include <limits>
#include <regex>
#include <vector>
#include "tessera/status.h"
#include "utils/logging.h"
#include "utils/result.h"
#include "utils/utils.h"

namespace Tessera {

namespace {

    struct IntervalFormat {
        IntervalType type;
        const char *name;
        const char *pattern;
    };

    // Capture group 1 holds the sign. The remaining groups hold the fields of the subtype, from most to least significant.
    constexpr IntervalFormat FORMATS[] {
        {IntervalType::YEAR, "YEAR", R"(^(-?)(\d+)$)"},
        {IntervalType::YEAR_TO_MONTH, "YEAR TO MONTH", R"(^(-?)(\d+)-(\d+)$)"},
        {IntervalType::MONTH, "MONTH", R"(^(-?)(\d+)$)"},
        {IntervalType::DAY, "DAY", R"(^(-?)(\d+)$)"},
        {IntervalType::DAY_TO_HOUR, "DAY TO HOUR", R"(^(-?)(\d+) (\d+)$)"},
        {IntervalType::DAY_TO_MINUTE, "DAY TO MINUTE", R"(^(-?)(\d+) (\d+):(\d+)$)"},
        {IntervalType::DAY_TO_SECOND, "DAY TO SECOND", R"(^(-?)(\d+) (\d+):(\d+):(\d+\.?\d*)$)"},
        {IntervalType::HOUR, "HOUR", R"(^(-?)(\d+)$)"},
        {IntervalType::HOUR_TO_MINUTE, "HOUR TO MINUTE", R"(^(-?)(\d+):(\d+)$)"},
        {IntervalType::HOUR_TO_SECOND, "HOUR TO SECOND", R"(^(-?)(\d+):(\d+):(\d+\.?\d*)$)"},
        {IntervalType::MINUTE, "MINUTE", R"(^(-?)(\d+)$)"},
        {IntervalType::MINUTE_TO_SECOND, "MINUTE TO SECOND", R"(^(-?)(\d+):(\d+\.?\d*)$)"},
        {IntervalType::SECOND, "SECOND", R"(^(-?)(\d+\.?\d*)$)"},
    };

    constexpr auto INTERVAL_PREFIX = "INTERVAL ";

    auto format_of(IntervalType type) -> const IntervalFormat &
    {
        const auto index = static_cast<Size>(type);
        TESSERA_EXPECT_LT(index, std::size(FORMATS));
        TESSERA_EXPECT_EQ(FORMATS[index].type, type);
        return FORMATS[index];
    }

    auto parse_size(const std::string &digits) -> Result<Size>
    {
        Size value {};
        for (const auto c: digits) {
            const auto digit = static_cast<Size>(c - '0');
            if (value > (std::numeric_limits<Size>::max() - digit) / 10) {
                return Err {Status::invalid_interval("interval field \"" + digits + "\" is too large")};
            }
            value = value * 10 + digit;
        }
        return value;
    }

    auto is_year_month(IntervalType type) -> bool
    {
        return type == IntervalType::YEAR || type == IntervalType::YEAR_TO_MONTH || type == IntervalType::MONTH;
    }

    auto is_nonzero(const std::optional<Size> &field) -> bool
    {
        return field && *field != 0;
    }

    // Format a non-negative field with its integral part zero-padded to "width" digits, rounded to 6 fractional
    // digits, without trailing zeros.
    auto append_field(std::string &out, const Decimal &value, Size width) -> void
    {
        auto text = value.to_fixed(6);
        const auto point = text.find('.');
        TESSERA_EXPECT_NE(point, std::string::npos);
        if (point < width) {
            text.insert(0, width - point, '0');
        }
        text.erase(text.find_last_not_of('0') + 1);
        if (text.back() == '.') {
            text.pop_back();
        }
        out.append(text);
    }

} // namespace

auto get_interval_type_name(IntervalType type) -> const char *
{
    return format_of(type).name;
}

auto parse_interval_type(const Slice &type_name, IntervalType &out) -> Status
{
    auto name = strip(type_name);
    if (name.starts_with(INTERVAL_PREFIX)) {
        name.advance(std::char_traits<Byte>::length(INTERVAL_PREFIX));
        for (const auto &format: FORMATS) {
            if (name == format.name) {
                out = format.type;
                return Status::ok();
            }
        }
    }
    return Status::not_found("\"" + escape_string(type_name) + "\" is not an interval type");
}

Interval::Interval()
    : m_type {IntervalType::SECOND}
{
    m_fields.seconds = Decimal {};
}

Interval::Interval(IntervalType type, IntervalFields fields)
    : m_type {type},
      m_fields {std::move(fields)}
{
    TESSERA_EXPECT_TRUE(!m_fields.seconds || !m_fields.seconds->is_negative());
}

auto Interval::year(Size years, bool negative) -> Interval
{
    IntervalFields fields;
    fields.years = years;
    fields.negative = negative;
    return Interval {IntervalType::YEAR, fields};
}

auto Interval::year_to_month(Size years, Size months, bool negative) -> Interval
{
    IntervalFields fields;
    fields.years = years;
    fields.months = months;
    fields.negative = negative;
    return Interval {IntervalType::YEAR_TO_MONTH, fields};
}

auto Interval::month(Size months, bool negative) -> Interval
{
    IntervalFields fields;
    fields.months = months;
    fields.negative = negative;
    return Interval {IntervalType::MONTH, fields};
}

auto Interval::day(Size days, bool negative) -> Interval
{
    IntervalFields fields;
    fields.days = days;
    fields.negative = negative;
    return Interval {IntervalType::DAY, fields};
}

auto Interval::day_to_hour(Size days, Size hours, bool negative) -> Interval
{
    IntervalFields fields;
    fields.days = days;
    fields.hours = hours;
    fields.negative = negative;
    return Interval {IntervalType::DAY_TO_HOUR, fields};
}

auto Interval::day_to_minute(Size days, Size hours, Size minutes, bool negative) -> Interval
{
    IntervalFields fields;
    fields.days = days;
    fields.hours = hours;
    fields.minutes = minutes;
    fields.negative = negative;
    return Interval {IntervalType::DAY_TO_MINUTE, fields};
}

auto Interval::day_to_second(Size days, Size hours, Size minutes, const Decimal &seconds, bool negative) -> Interval
{
    IntervalFields fields;
    fields.days = days;
    fields.hours = hours;
    fields.minutes = minutes;
    fields.seconds = seconds;
    fields.negative = negative;
    return Interval {IntervalType::DAY_TO_SECOND, fields};
}

auto Interval::hour(Size hours, bool negative) -> Interval
{
    IntervalFields fields;
    fields.hours = hours;
    fields.negative = negative;
    return Interval {IntervalType::HOUR, fields};
}

auto Interval::hour_to_minute(Size hours, Size minutes, bool negative) -> Interval
{
    IntervalFields fields;
    fields.hours = hours;
    fields.minutes = minutes;
    fields.negative = negative;
    return Interval {IntervalType::HOUR_TO_MINUTE, fields};
}

auto Interval::hour_to_second(Size hours, Size minutes, const Decimal &seconds, bool negative) -> Interval
{
    IntervalFields fields;
    fields.hours = hours;
    fields.minutes = minutes;
    fields.seconds = seconds;
    fields.negative = negative;
    return Interval {IntervalType::HOUR_TO_SECOND, fields};
}

auto Interval::minute(Size minutes, bool negative) -> Interval
{
    IntervalFields fields;
    fields.minutes = minutes;
    fields.negative = negative;
    return Interval {IntervalType::MINUTE, fields};
}

auto Interval::minute_to_second(Size minutes, const Decimal &seconds, bool negative) -> Interval
{
    IntervalFields fields;
    fields.minutes = minutes;
    fields.seconds = seconds;
    fields.negative = negative;
    return Interval {IntervalType::MINUTE_TO_SECOND, fields};
}

auto Interval::second(const Decimal &seconds, bool negative) -> Interval
{
    IntervalFields fields;
    fields.seconds = seconds;
    fields.negative = negative;
    return Interval {IntervalType::SECOND, fields};
}

auto Interval::from_fields(const IntervalFields &fields, Interval &out) -> Status
{
    if (fields.seconds && (!fields.seconds->is_finite() || fields.seconds->is_negative())) {
        return Status::invalid_interval("interval seconds must be a finite, non-negative number");
    }
    const auto zero = [](const auto &field) {
        return field.value_or(0);
    };
    const auto &[years, months, days, hours, minutes, seconds, negative] = fields;

    if (years || months) {
        if (is_nonzero(days) || is_nonzero(hours) || is_nonzero(minutes) || (seconds && !seconds->is_zero())) {
            return Status::invalid_interval("A year/month interval cannot be shared with a day/hour/minute/second interval.");
        }
        if (!years) {
            out = month(*months, negative);
        } else if (months) {
            out = year_to_month(*years, *months, negative);
        } else {
            out = year(*years, negative);
        }
    } else if (days) {
        if (seconds) {
            out = day_to_second(*days, zero(hours), zero(minutes), *seconds, negative);
        } else if (minutes) {
            out = day_to_minute(*days, zero(hours), *minutes, negative);
        } else if (hours) {
            out = day_to_hour(*days, *hours, negative);
        } else {
            out = day(*days, negative);
        }
    } else if (hours) {
        if (seconds) {
            out = hour_to_second(*hours, zero(minutes), *seconds, negative);
        } else if (minutes) {
            out = hour_to_minute(*hours, *minutes, negative);
        } else {
            out = hour(*hours, negative);
        }
    } else if (minutes) {
        if (seconds) {
            out = minute_to_second(*minutes, *seconds, negative);
        } else {
            out = minute(*minutes, negative);
        }
    } else if (seconds) {
        out = second(*seconds, negative);
    } else {
        return Status::invalid_interval("One of years, months, days, hours, minutes, seconds must be present.");
    }
    return Status::ok();
}

auto Interval::to_string() const -> std::string
{
    std::string out;
    if (m_fields.negative) {
        out.push_back('-');
    }
    const auto start = out.size();
    const auto append = [&out, start](const std::optional<Decimal> &field, Size width, char separator) {
        if (field) {
            if (out.size() > start) {
                out.push_back(separator);
            }
            append_field(out, *field, width);
        }
    };
    const auto to_decimal = [](const std::optional<Size> &field) -> std::optional<Decimal> {
        if (field) {
            return Decimal::from_integer(static_cast<std::int64_t>(*field));
        }
        return std::nullopt;
    };
    append(to_decimal(m_fields.years), 1, ' ');
    append(to_decimal(m_fields.months), 2, '-');
    append(to_decimal(m_fields.days), 1, ' ');
    append(to_decimal(m_fields.hours), 2, ' ');
    append(to_decimal(m_fields.minutes), 2, ':');
    append(m_fields.seconds, 2, ':');
    return out;
}

auto Interval::to_duration(std::chrono::microseconds &out) const -> Status
{
    if (is_year_month(m_type)) {
        return Status::not_supported(std::string {"INTERVAL "} + get_interval_type_name(m_type) + " has no fixed length");
    }
    static constexpr std::int64_t MAXIMUM {std::numeric_limits<std::int64_t>::max()};
    static constexpr std::int64_t UNITS[] {86'400'000'000, 3'600'000'000, 60'000'000};
    const std::optional<Size> fields[] {m_fields.days, m_fields.hours, m_fields.minutes};

    std::int64_t total {};
    for (Size i {}; i < std::size(fields); ++i) {
        const auto field = fields[i].value_or(0);
        if (field > static_cast<Size>((MAXIMUM - total) / UNITS[i])) {
            return Status::invalid_interval("interval \"" + to_string() + "\" is too long");
        }
        total += static_cast<std::int64_t>(field) * UNITS[i];
    }
    if (m_fields.seconds) {
        std::int64_t micros;
        if (!m_fields.seconds->scale(6).round(0).to_integer(micros).is_ok() || micros > MAXIMUM - total) {
            return Status::invalid_interval("interval \"" + to_string() + "\" is too long");
        }
        total += micros;
    }
    out = std::chrono::microseconds {m_fields.negative ? -total : total};
    return Status::ok();
}

auto operator==(const Interval &lhs, const Interval &rhs) -> bool
{
    const auto seconds_equal = lhs.seconds().has_value() == rhs.seconds().has_value() &&
                               (!lhs.seconds() || *lhs.seconds() == *rhs.seconds());
    return lhs.type() == rhs.type() && lhs.is_negative() == rhs.is_negative() &&
           lhs.years() == rhs.years() && lhs.months() == rhs.months() && lhs.days() == rhs.days() &&
           lhs.hours() == rhs.hours() && lhs.minutes() == rhs.minutes() && seconds_equal;
}

auto operator!=(const Interval &lhs, const Interval &rhs) -> bool
{
    return !(lhs == rhs);
}

auto parse_interval(IntervalType type, const Slice &text, Interval &out) -> Status
{
    // One pattern per subtype, compiled on first use.
    static const std::vector<std::regex> patterns = [] {
        std::vector<std::regex> result;
        for (const auto &format: FORMATS) {
            result.emplace_back(format.pattern);
        }
        return result;
    }();

    const auto &format = format_of(type);
    const auto input = strip(text).to_string();
    std::smatch match;
    if (!std::regex_match(input, match, patterns[static_cast<Size>(type)])) {
        return Status::invalid_interval(std::string {INTERVAL_PREFIX} + format.name + " format invalid: " + escape_string(text));
    }

    const auto negative = match[1].length() > 0;
    std::vector<Size> integers;
    std::optional<Decimal> seconds;
    for (Size i {2}; i < match.size(); ++i) {
        const auto group = match[i].str();
        const auto is_seconds = i + 1 == match.size() &&
            (type == IntervalType::SECOND || type == IntervalType::DAY_TO_SECOND ||
             type == IntervalType::HOUR_TO_SECOND || type == IntervalType::MINUTE_TO_SECOND);
        if (is_seconds) {
            Decimal value;
            Tessera_Try(Decimal::parse(group, value));
            seconds = value;
        } else {
            auto value = parse_size(group);
            if (!value.has_value()) {
                return value.error();
            }
            integers.emplace_back(*value);
        }
    }

    switch (type) {
        case IntervalType::YEAR:
            out = Interval::year(integers[0], negative);
            break;
        case IntervalType::YEAR_TO_MONTH:
            out = Interval::year_to_month(integers[0], integers[1], negative);
            break;
        case IntervalType::MONTH:
            out = Interval::month(integers[0], negative);
            break;
        case IntervalType::DAY:
            out = Interval::day(integers[0], negative);
            break;
        case IntervalType::DAY_TO_HOUR:
            out = Interval::day_to_hour(integers[0], integers[1], negative);
            break;
        case IntervalType::DAY_TO_MINUTE:
            out = Interval::day_to_minute(integers[0], integers[1], integers[2], negative);
            break;
        case IntervalType::DAY_TO_SECOND:
            out = Interval::day_to_second(integers[0], integers[1], integers[2], *seconds, negative);
            break;
        case IntervalType::HOUR:
            out = Interval::hour(integers[0], negative);
            break;
        case IntervalType::HOUR_TO_MINUTE:
            out = Interval::hour_to_minute(integers[0], integers[1], negative);
            break;
        case IntervalType::HOUR_TO_SECOND:
            out = Interval::hour_to_second(integers[0], integers[1], *seconds, negative);
            break;
        case IntervalType::MINUTE:
            out = Interval::minute(integers[0], negative);
            break;
        case IntervalType::MINUTE_TO_SECOND:
            out = Interval::minute_to_second(integers[0], *seconds, negative);
            break;
        case IntervalType::SECOND:
            out = Interval::second(*seconds, negative);
            break;
    }
    return Status::ok();
}

auto parse_interval(const Slice &type_name, const Slice &text, Interval &out) -> Status
{
    IntervalType type;
    Tessera_Try(parse_interval_type(type_name, type));
    return parse_interval(type, text, out);
}

} // namespace Tessera
