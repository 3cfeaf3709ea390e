#include "tessera/converter.h"
#include <cstdlib>
#include "json/json.h"
#include "tessera/status.h"
#include "utils/logging.h"
#include "utils/result.h"
#include "utils/system.h"
#include "utils/utils.h"

namespace Tessera {

namespace {

    constexpr const char *NUMBER_TYPES[] {
        "BYTEINT", "BIGINT", "DECIMAL", "DOUBLE", "DOUBLE PRECISION", "INTEGER",
        "NUMBER", "SMALLINT", "FLOAT", "INT", "NUMERIC", "REAL",
    };

    constexpr const char *FLOAT_TYPES[] {
        "FLOAT", "DOUBLE", "DOUBLE PRECISION", "REAL",
    };

    constexpr const char *BINARY_TYPES[] {
        "BLOB", "BYTE", "GRAPHIC", "LONG VARGRAPHIC", "VARBYTE", "VARGRAPHIC",
    };

    template<Size N>
    auto is_one_of(const Slice &name, const char *const (&names)[N]) -> bool
    {
        for (const auto *candidate: names) {
            if (name == candidate) {
                return true;
            }
        }
        return false;
    }

    auto hex_digit(Byte c) -> int
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        if (c >= 'a' && c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' && c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    }

    // Decode pairs of hex digits. Whitespace is allowed between pairs, but not inside of one.
    auto decode_hex(const Slice &text) -> Result<Binary>
    {
        Binary out;
        out.reserve(text.size() / 2);
        for (Size i {}; i < text.size(); ) {
            if (is_space(text[i])) {
                i++;
                continue;
            }
            const auto hi = hex_digit(text[i]);
            const auto lo = i + 1 < text.size() ? hex_digit(text[i + 1]) : -1;
            if (hi < 0 || lo < 0) {
                return Err {Status::invalid_argument(fmt::format(
                    "non-hexadecimal number found at position {} of \"{}\"", i, escape_string(text)))};
            }
            out.emplace_back(static_cast<std::uint8_t>(hi << 4 | lo));
            i += 2;
        }
        return out;
    }

    // Map an unconverted document value to its closest SQL value.
    auto pass_through(const Value &raw) -> SqlValue
    {
        switch (raw.type()) {
            case ValueType::NULL_VALUE:
                return std::monostate {};
            case ValueType::BOOLEAN:
                return raw.as_boolean();
            case ValueType::NUMBER:
                return raw.as_number();
            case ValueType::STRING:
                return raw.as_string();
            default:
                return raw;
        }
    }

} // namespace

auto get_type_code_name(TypeCode code) -> const char *
{
    switch (code) {
        case TypeCode::STRING:
            return "STRING";
        case TypeCode::NUMBER:
            return "NUMBER";
        case TypeCode::FLOAT:
            return "FLOAT";
        case TypeCode::BINARY:
            return "BINARY";
        case TypeCode::DATE:
            return "DATE";
        case TypeCode::TIME:
            return "TIME";
        case TypeCode::TIMESTAMP:
            return "TIMESTAMP";
    }
    return "UNKNOWN";
}

DefaultDataTypeConverter::DefaultDataTypeConverter() = default;

DefaultDataTypeConverter::~DefaultDataTypeConverter() = default;

auto DefaultDataTypeConverter::open(const Options &options) -> Status
{
    Tessera_Try(validate_options(options));

    try {
        System system {options.log_prefix.to_string(), options};
        m_log = system.create_log("converter");
    } catch (const spdlog::spdlog_ex &error) {
        return Status::system_error(error.what());
    }
    m_use_float = options.use_float;
    return Status::ok();
}

auto DefaultDataTypeConverter::convert_type(const Slice &, const Slice &data_type) const -> TypeCode
{
    if (is_one_of(data_type, NUMBER_TYPES)) {
        if (m_use_float && is_one_of(data_type, FLOAT_TYPES)) {
            return TypeCode::FLOAT;
        }
        return TypeCode::NUMBER;
    }
    if (is_one_of(data_type, BINARY_TYPES)) {
        return TypeCode::BINARY;
    }
    // TIMESTAMP must be checked before TIME.
    if (data_type.starts_with("DATE")) {
        return TypeCode::DATE;
    }
    if (data_type.starts_with("TIMESTAMP")) {
        return TypeCode::TIMESTAMP;
    }
    if (data_type.starts_with("TIME")) {
        return TypeCode::TIME;
    }
    return TypeCode::STRING;
}

auto DefaultDataTypeConverter::convert_value(const Slice &, const Slice &data_type, TypeCode type_code,
                                             const Value &raw, SqlValue &out) const -> Status
{
    if (m_log == nullptr) {
        return Status::logic_error("converter is not open");
    }
    if (m_log->should_log(spdlog::level::trace)) {
        m_log->trace("converting {} to ({}, {})", raw.to_string(), escape_string(data_type), get_type_code_name(type_code));
    }
    if (raw.is_null()) {
        out = std::monostate {};
        return Status::ok();
    }
    switch (type_code) {
        case TypeCode::NUMBER:
            return convert_number(raw, out);
        case TypeCode::FLOAT:
            return convert_float(raw, out);
        case TypeCode::DATE:
        case TypeCode::TIME:
        case TypeCode::TIMESTAMP:
            return convert_temporal(type_code, raw, out);
        case TypeCode::BINARY:
            if (raw.is_string()) {
                return convert_binary(raw, out);
            }
            break;
        default:
            break;
    }
    return convert_text(data_type, raw, out);
}

auto DefaultDataTypeConverter::convert_number(const Value &raw, SqlValue &out) const -> Status
{
    if (raw.is_number()) {
        out = raw.as_number();
        return Status::ok();
    }
    if (!raw.is_string()) {
        return Status::invalid_argument(fmt::format("cannot convert {} to a number", raw.to_string()));
    }
    const auto &text = raw.as_string();
    Decimal number;
    if (Decimal::parse(text, number).is_ok()) {
        out = number;
    } else if (text == "1.#INF") {
        out = Decimal::infinity();
    } else if (text == "-1.#INF") {
        out = Decimal::infinity(true);
    } else {
        m_log->trace("\"{}\" is not a number, using NaN", escape_string(text));
        out = Decimal::nan();
    }
    return Status::ok();
}

auto DefaultDataTypeConverter::convert_float(const Value &raw, SqlValue &out) const -> Status
{
    if (raw.is_number()) {
        out = raw.as_number().to_double();
        return Status::ok();
    }
    if (!raw.is_string()) {
        return Status::invalid_argument(fmt::format("cannot convert {} to a float", raw.to_string()));
    }
    const auto text = strip(raw.as_string()).to_string();
    char *end {};
    const auto value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        return Status::invalid_argument("could not convert string to float: \"" + escape_string(text) + "\"");
    }
    // Out-of-range values become +/-HUGE_VAL.
    out = value;
    return Status::ok();
}

auto DefaultDataTypeConverter::convert_temporal(TypeCode type_code, const Value &raw, SqlValue &out) const -> Status
{
    if (raw.is_string()) {
        const auto &text = raw.as_string();
        if (type_code == TypeCode::DATE) {
            Date date;
            Tessera_Try(parse_date(text, date));
            out = date;
        } else if (type_code == TypeCode::TIME) {
            Time time;
            Tessera_Try(parse_time(text, time));
            out = time;
        } else {
            Timestamp timestamp;
            Tessera_Try(parse_timestamp(text, timestamp));
            out = timestamp;
        }
        return Status::ok();
    }

    std::int64_t ms {};
    if (!raw.is_number() || !raw.as_number().to_integer(ms).is_ok()) {
        return Status::invalid_argument(fmt::format("cannot convert {} to a {} value", raw.to_string(), get_type_code_name(type_code)));
    }
    const auto timestamp = timestamp_from_epoch_ms(ms);
    if (type_code == TypeCode::DATE) {
        out = timestamp.date;
    } else if (type_code == TypeCode::TIME) {
        out = timestamp.time;
    } else {
        out = timestamp;
    }
    return Status::ok();
}

auto DefaultDataTypeConverter::convert_binary(const Value &raw, SqlValue &out) const -> Status
{
    auto bytes = decode_hex(raw.as_string());
    if (!bytes.has_value()) {
        return bytes.error();
    }
    out = std::move(*bytes);
    return Status::ok();
}

auto DefaultDataTypeConverter::convert_text(const Slice &data_type, const Value &raw, SqlValue &out) const -> Status
{
    if (!raw.is_string()) {
        out = pass_through(raw);
        return Status::ok();
    }
    const auto &text = raw.as_string();

    if (data_type.starts_with("INTERVAL")) {
        IntervalType type;
        if (parse_interval_type(data_type, type).is_ok()) {
            Interval interval;
            Tessera_Try(parse_interval(type, text, interval));
            out = interval;
            return Status::ok();
        }
        m_log->trace("unknown interval type {}", escape_string(data_type));
    } else if (data_type.starts_with("JSON")) {
        Value document;
        Tessera_Try(Json::decode(text, document));
        out = std::move(document);
        return Status::ok();
    } else if (data_type.starts_with("PERIOD")) {
        AnyPeriod period;
        Tessera_Try(parse_period(data_type, text, period));
        std::visit([&out](auto &&p) {out = p;}, period);
        return Status::ok();
    }
    out = text;
    return Status::ok();
}

} // namespace Tessera
