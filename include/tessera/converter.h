#ifndef TESSERA_CONVERTER_H
#define TESSERA_CONVERTER_H

#include <cstdint>
#include <memory>
#include <variant>
#include <vector>
#include "interval.h"
#include "options.h"
#include "period.h"
#include "value.h"

namespace spdlog {
class logger;
} // namespace spdlog

namespace Tessera {

class Status;

enum class TypeCode {
    STRING,
    NUMBER,
    FLOAT,
    BINARY,
    DATE,
    TIME,
    TIMESTAMP,
};

[[nodiscard]] auto get_type_code_name(TypeCode code) -> const char *;

using Binary = std::vector<std::uint8_t>;

// Typed SQL value. std::monostate represents SQL NULL. Values that are not converted keep their document form.
using SqlValue = std::variant<
    std::monostate,
    bool,
    Decimal,
    double,
    std::string,
    Binary,
    Date,
    Time,
    Timestamp,
    Interval,
    DatePeriod,
    TimePeriod,
    TimestampPeriod,
    Value>;

/*
 * Maps database type names to type codes, and raw values from a response document to typed values.
 * Implementations must be safe to call from multiple threads.
 */
class DataTypeConverter {
public:
    virtual ~DataTypeConverter() = default;

    [[nodiscard]] virtual auto convert_type(const Slice &db_type, const Slice &data_type) const -> TypeCode = 0;

    [[nodiscard]] virtual auto convert_value(const Slice &db_type, const Slice &data_type, TypeCode type_code,
                                             const Value &raw, SqlValue &out) const -> Status = 0;
};

/*
 * Converter for the type names used by the database:
 *     NUMBER:    BYTEINT, BIGINT, DECIMAL, DOUBLE, DOUBLE PRECISION, INTEGER, NUMBER, SMALLINT, FLOAT, INT,
 *                NUMERIC, REAL (FLOAT, DOUBLE, DOUBLE PRECISION, and REAL become FLOAT if Options::use_float
 *                is set)
 *     BINARY:    BLOB, BYTE, GRAPHIC, LONG VARGRAPHIC, VARBYTE, VARGRAPHIC
 *     DATE, TIMESTAMP, TIME: by prefix of the type name
 *     STRING:    everything else, with INTERVAL*, PERIOD*, and JSON* values decoded from their text
 */
class DefaultDataTypeConverter : public DataTypeConverter {
public:
    DefaultDataTypeConverter();
    ~DefaultDataTypeConverter() override;

    /*
     * Check the options and set up logging. Must be called before convert_value(), which returns a
     * logic_error status otherwise. Returns an invalid_argument status if the options are out of range, and a
     * system_error status if the log could not be created.
     */
    [[nodiscard]] auto open(const Options &options = {}) -> Status;

    [[nodiscard]] auto convert_type(const Slice &db_type, const Slice &data_type) const -> TypeCode override;
    [[nodiscard]] auto convert_value(const Slice &db_type, const Slice &data_type, TypeCode type_code,
                                     const Value &raw, SqlValue &out) const -> Status override;

private:
    [[nodiscard]] auto convert_number(const Value &raw, SqlValue &out) const -> Status;
    [[nodiscard]] auto convert_float(const Value &raw, SqlValue &out) const -> Status;
    [[nodiscard]] auto convert_temporal(TypeCode type_code, const Value &raw, SqlValue &out) const -> Status;
    [[nodiscard]] auto convert_binary(const Value &raw, SqlValue &out) const -> Status;
    [[nodiscard]] auto convert_text(const Slice &data_type, const Value &raw, SqlValue &out) const -> Status;

    std::shared_ptr<spdlog::logger> m_log;
    bool m_use_float {};
};

} // namespace Tessera

#endif // TESSERA_CONVERTER_H
