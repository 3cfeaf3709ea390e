#ifndef TESSERA_DECIMAL_H
#define TESSERA_DECIMAL_H

#include <cstdint>
#include <string>
#include "slice.h"

namespace Tessera {

class Status;

/*
 * Arbitrary-precision decimal number. The value is stored as a string of coefficient digits and a
 * base-10 exponent, so numbers like 10101010101010101010101 or 0.1 are represented exactly.
 */
class Decimal final {
public:
    // Construct a decimal equal to zero.
    Decimal() = default;

    /*
     * Parse a decimal number. Accepts an optional sign, digits with an optional decimal point, and an
     * optional exponent ("-201.50E1"), as well as "Infinity", "Inf", and "NaN" (case-insensitive).
     * Surrounding whitespace is ignored.
     */
    [[nodiscard]] static auto parse(const Slice &text, Decimal &out) -> Status;

    [[nodiscard]] static auto from_integer(std::int64_t value) -> Decimal;
    [[nodiscard]] static auto infinity(bool negative = false) -> Decimal;
    [[nodiscard]] static auto nan() -> Decimal;

    [[nodiscard]] auto is_negative() const -> bool
    {
        return m_negative;
    }

    [[nodiscard]] auto is_nan() const -> bool
    {
        return m_kind == Kind::NAN_VALUE;
    }

    [[nodiscard]] auto is_infinite() const -> bool
    {
        return m_kind == Kind::INFINITE;
    }

    [[nodiscard]] auto is_finite() const -> bool
    {
        return m_kind == Kind::FINITE;
    }

    [[nodiscard]] auto is_zero() const -> bool;
    [[nodiscard]] auto is_integer() const -> bool;

    // Coefficient digits, without leading zeros ("0" for zero).
    [[nodiscard]] auto digits() const -> const std::string &
    {
        return m_digits;
    }

    [[nodiscard]] auto exponent() const -> std::int64_t
    {
        return m_exponent;
    }

    /*
     * Render the number in the shortest form that preserves every stored digit. Scientific notation
     * is used for positive exponents and very small numbers ("1E+3", "1E-7").
     */
    [[nodiscard]] auto to_string() const -> std::string;

    /*
     * Render the number in fixed-point notation with exactly "places" fractional digits, rounding
     * half away from zero.
     */
    [[nodiscard]] auto to_fixed(Size places) const -> std::string;

    [[nodiscard]] auto to_double() const -> double;

    // Convert to a 64-bit integer. Fails if the number is not an integer or is out of range.
    [[nodiscard]] auto to_integer(std::int64_t &out) const -> Status;

    // Multiply by 10^places. The result is exact.
    [[nodiscard]] auto scale(std::int64_t places) const -> Decimal;

    // Round to "places" fractional digits, half away from zero.
    [[nodiscard]] auto round(Size places) const -> Decimal;

    [[nodiscard]] auto abs() const -> Decimal;

private:
    enum class Kind : Byte {
        FINITE,
        INFINITE,
        NAN_VALUE,
    };

    Decimal(Kind kind, bool negative, std::string digits, std::int64_t exponent);

    [[nodiscard]] auto rounded_digits(Size places) const -> std::string;

    Kind m_kind {Kind::FINITE};
    bool m_negative {};
    std::string m_digits {"0"};
    std::int64_t m_exponent {};

    friend auto operator==(const Decimal &lhs, const Decimal &rhs) -> bool;
};

/*
 * Numeric comparison: trailing zeros and the sign of zero are ignored, so "-201.50E1" equals "-2015"
 * and "0" equals "-0.00". NaN is never equal to anything, including itself.
 */
auto operator==(const Decimal &lhs, const Decimal &rhs) -> bool;
auto operator!=(const Decimal &lhs, const Decimal &rhs) -> bool;

} // namespace Tessera

#endif // TESSERA_DECIMAL_H
