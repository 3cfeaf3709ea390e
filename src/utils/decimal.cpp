#include "tessera/decimal.h"
#include <cstdlib>
#include <limits>
#include "logging.h"
#include "tessera/status.h"
#include "utils.h"

namespace Tessera {

// Exponents beyond this are rejected while parsing. Keeps the exponent arithmetic far from overflow.
static constexpr std::int64_t MAXIMUM_EXPONENT {999'999'999};

static auto strip_leading_zeros(std::string &digits) -> void
{
    const auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        digits = "0";
    } else if (first != 0) {
        digits.erase(0, first);
    }
}

static auto equals_ignoring_case(const Slice &lhs, const char *rhs) -> bool
{
    const Slice other {rhs};
    if (lhs.size() != other.size()) {
        return false;
    }
    for (Size i {}; i < lhs.size(); ++i) {
        const auto a = lhs[i] >= 'A' && lhs[i] <= 'Z' ? static_cast<Byte>(lhs[i] - 'A' + 'a') : lhs[i];
        if (a != other[i]) {
            return false;
        }
    }
    return true;
}

Decimal::Decimal(Kind kind, bool negative, std::string digits, std::int64_t exponent)
    : m_kind {kind},
      m_negative {negative},
      m_digits {std::move(digits)},
      m_exponent {exponent}
{}

auto Decimal::parse(const Slice &input, Decimal &out) -> Status
{
    const auto invalid = [&input] {
        return Status::invalid_argument("invalid decimal literal \"" + escape_string(input) + "\"");
    };

    auto text = strip(input);
    if (text.is_empty()) {
        return invalid();
    }
    auto negative = false;
    if (text[0] == '+' || text[0] == '-') {
        negative = text[0] == '-';
        text.advance();
    }

    if (equals_ignoring_case(text, "infinity") || equals_ignoring_case(text, "inf")) {
        out = Decimal {Kind::INFINITE, negative, "0", 0};
        return Status::ok();
    }
    if (equals_ignoring_case(text, "nan")) {
        out = Decimal {Kind::NAN_VALUE, negative, "0", 0};
        return Status::ok();
    }

    std::string digits;
    std::int64_t exponent {};
    auto seen_point = false;
    Size i {};

    for (; i < text.size(); ++i) {
        const auto c = text[i];
        if (is_digit(c)) {
            digits.push_back(c);
            if (seen_point) {
                --exponent;
            }
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }
    if (digits.empty()) {
        return invalid();
    }

    if (i < text.size()) {
        if (text[i] != 'e' && text[i] != 'E') {
            return invalid();
        }
        ++i;
        auto exponent_negative = false;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
            exponent_negative = text[i] == '-';
            ++i;
        }
        if (i == text.size()) {
            return invalid();
        }
        std::int64_t power {};
        for (; i < text.size(); ++i) {
            if (!is_digit(text[i])) {
                return invalid();
            }
            power = power * 10 + (text[i] - '0');
            if (power > MAXIMUM_EXPONENT) {
                return invalid();
            }
        }
        exponent += exponent_negative ? -power : power;
    }

    strip_leading_zeros(digits);
    out = Decimal {Kind::FINITE, negative, std::move(digits), exponent};
    return Status::ok();
}

auto Decimal::from_integer(std::int64_t value) -> Decimal
{
    const auto negative = value < 0;
    const auto magnitude = negative
        ? std::uint64_t {0} - static_cast<std::uint64_t>(value)
        : static_cast<std::uint64_t>(value);
    return Decimal {Kind::FINITE, negative, std::to_string(magnitude), 0};
}

auto Decimal::infinity(bool negative) -> Decimal
{
    return Decimal {Kind::INFINITE, negative, "0", 0};
}

auto Decimal::nan() -> Decimal
{
    return Decimal {Kind::NAN_VALUE, false, "0", 0};
}

auto Decimal::is_zero() const -> bool
{
    return is_finite() && m_digits == "0";
}

auto Decimal::is_integer() const -> bool
{
    if (!is_finite()) {
        return false;
    }
    if (m_exponent >= 0 || is_zero()) {
        return true;
    }
    const auto fraction = static_cast<Size>(-m_exponent);
    if (fraction >= m_digits.size()) {
        return false;
    }
    return m_digits.find_first_not_of('0', m_digits.size() - fraction) == std::string::npos;
}

auto Decimal::to_string() const -> std::string
{
    std::string out {m_negative ? "-" : ""};
    if (is_infinite()) {
        return out + "Infinity";
    } else if (is_nan()) {
        return out + "NaN";
    }

    // Plain notation is used unless the exponent is positive or the number is very small, in which case a
    // single digit is placed before the point and an exponent is appended.
    const auto length = static_cast<std::int64_t>(m_digits.size());
    const auto left_digits = m_exponent + length;
    const auto dot_place = m_exponent <= 0 && left_digits > -6 ? left_digits : 1;

    if (dot_place <= 0) {
        out.append("0.");
        out.append(static_cast<Size>(-dot_place), '0');
        out.append(m_digits);
    } else if (dot_place >= length) {
        out.append(m_digits);
        out.append(static_cast<Size>(dot_place - length), '0');
    } else {
        out.append(m_digits, 0, static_cast<Size>(dot_place));
        out.push_back('.');
        out.append(m_digits, static_cast<Size>(dot_place), std::string::npos);
    }

    if (left_digits != dot_place) {
        const auto power = left_digits - dot_place;
        out.push_back('E');
        out.push_back(power < 0 ? '-' : '+');
        out.append(std::to_string(power < 0 ? -power : power));
    }
    return out;
}

// Get the coefficient of this number rounded to "places" fractional digits. The result has an implied
// exponent of -places.
auto Decimal::rounded_digits(Size places) const -> std::string
{
    TESSERA_EXPECT_TRUE(is_finite());
    const auto shift = m_exponent + static_cast<std::int64_t>(places);
    if (shift >= 0) {
        auto result = m_digits;
        result.append(static_cast<Size>(shift), '0');
        strip_leading_zeros(result);
        return result;
    }

    // Every digit is cut off, and the first one cut is an implied zero.
    const auto cut = static_cast<Size>(-shift);
    if (cut > m_digits.size()) {
        return "0";
    }

    // Pad so that at least one digit remains in front of the ones that are cut off.
    std::string padded(cut + 1 > m_digits.size() ? cut + 1 - m_digits.size() : 0, '0');
    padded.append(m_digits);

    auto kept = padded.substr(0, padded.size() - cut);
    if (padded[kept.size()] >= '5') {
        auto i = kept.size();
        for (; i > 0; --i) {
            if (kept[i - 1] != '9') {
                ++kept[i - 1];
                break;
            }
            kept[i - 1] = '0';
        }
        if (i == 0) {
            kept.insert(kept.begin(), '1');
        }
    }
    strip_leading_zeros(kept);
    return kept;
}

auto Decimal::to_fixed(Size places) const -> std::string
{
    if (!is_finite()) {
        return to_string();
    }
    auto digits = rounded_digits(places);
    if (digits.size() <= places) {
        digits.insert(0, places + 1 - digits.size(), '0');
    }
    std::string out;
    if (m_negative && digits.find_first_not_of('0') != std::string::npos) {
        out.push_back('-');
    }
    out.append(digits, 0, digits.size() - places);
    if (places) {
        out.push_back('.');
        out.append(digits, digits.size() - places, std::string::npos);
    }
    return out;
}

auto Decimal::to_double() const -> double
{
    const auto text = to_string();
    return std::strtod(text.c_str(), nullptr);
}

auto Decimal::to_integer(std::int64_t &out) const -> Status
{
    if (!is_integer()) {
        return Status::invalid_argument("decimal \"" + to_string() + "\" is not an integer");
    }
    if (is_zero()) {
        out = 0;
        return Status::ok();
    }
    std::string digits {m_digits};
    if (m_exponent >= 0) {
        if (m_exponent > 20) {
            return Status::invalid_argument("decimal \"" + to_string() + "\" is out of range");
        }
        digits.append(static_cast<Size>(m_exponent), '0');
    } else {
        digits.resize(digits.size() - static_cast<Size>(-m_exponent));
    }
    strip_leading_zeros(digits);

    const auto limit = m_negative
        ? std::uint64_t {1} << 63
        : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    std::uint64_t magnitude {};
    for (const auto c: digits) {
        const auto digit = static_cast<std::uint64_t>(c - '0');
        if (magnitude > (limit - digit) / 10) {
            return Status::invalid_argument("decimal \"" + to_string() + "\" is out of range");
        }
        magnitude = magnitude * 10 + digit;
    }
    out = m_negative
        ? static_cast<std::int64_t>(std::uint64_t {0} - magnitude)
        : static_cast<std::int64_t>(magnitude);
    return Status::ok();
}

auto Decimal::scale(std::int64_t places) const -> Decimal
{
    auto result = *this;
    if (result.is_finite() && !result.is_zero()) {
        result.m_exponent += places;
    }
    return result;
}

auto Decimal::round(Size places) const -> Decimal
{
    if (!is_finite() || m_exponent >= -static_cast<std::int64_t>(places)) {
        return *this;
    }
    return Decimal {Kind::FINITE, m_negative, rounded_digits(places), -static_cast<std::int64_t>(places)};
}

auto Decimal::abs() const -> Decimal
{
    auto result = *this;
    result.m_negative = false;
    return result;
}

auto operator==(const Decimal &lhs, const Decimal &rhs) -> bool
{
    if (lhs.is_nan() || rhs.is_nan()) {
        return false;
    }
    if (lhs.is_infinite() || rhs.is_infinite()) {
        return lhs.m_kind == rhs.m_kind && lhs.m_negative == rhs.m_negative;
    }
    if (lhs.is_zero() || rhs.is_zero()) {
        return lhs.is_zero() && rhs.is_zero();
    }
    if (lhs.m_negative != rhs.m_negative) {
        return false;
    }
    // Compare without trailing zeros, which only affect the exponent.
    const auto significant = [](const Decimal &d, std::int64_t &exponent) {
        const auto last = d.m_digits.find_last_not_of('0');
        exponent = d.m_exponent + static_cast<std::int64_t>(d.m_digits.size() - last - 1);
        return Slice {d.m_digits}.range(0, last + 1);
    };
    std::int64_t lhs_exponent, rhs_exponent;
    const auto lhs_digits = significant(lhs, lhs_exponent);
    const auto rhs_digits = significant(rhs, rhs_exponent);
    return lhs_exponent == rhs_exponent && lhs_digits == rhs_digits;
}

auto operator!=(const Decimal &lhs, const Decimal &rhs) -> bool
{
    return !(lhs == rhs);
}

} // namespace Tessera
