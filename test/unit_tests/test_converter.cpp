#include <cmath>
#include <gtest/gtest.h>
#include "harness.h"
#include "json/json.h"
#include "tessera/converter.h"

namespace {

using namespace Tessera;

auto document(const char *text) -> Value
{
    Value out;
    EXPECT_OK(Json::decode(text, out));
    return out;
}

class ConverterTests : public testing::Test {
public:
    explicit ConverterTests(bool use_float = false)
        : m_use_float {use_float}
    {}

    ~ConverterTests() override = default;

    auto SetUp() -> void override
    {
        ASSERT_OK(m_converter.open(make_options(m_use_float)));
    }

    [[nodiscard]] auto convert(const char *data_type, const Value &raw, SqlValue &out) const -> Status
    {
        const auto type_code = m_converter.convert_type("teradata", data_type);
        return m_converter.convert_value("teradata", data_type, type_code, raw, out);
    }

    [[nodiscard]] auto convert(const char *data_type, const Value &raw) const -> SqlValue
    {
        SqlValue out;
        EXPECT_OK(convert(data_type, raw, out));
        return out;
    }

    DefaultDataTypeConverter m_converter;

private:
    static auto make_options(bool use_float) -> Options
    {
        Options options;
        options.use_float = use_float;
        options.log_level = LogLevel::TRACE;
        options.log_target = LogTarget::STDERR;
        return options;
    }

    bool m_use_float {};
};

class FloatConverterTests : public ConverterTests {
public:
    FloatConverterTests()
        : ConverterTests {true}
    {}
};

TEST(ConverterOpenTests, ConverterMustBeOpened)
{
    DefaultDataTypeConverter converter;
    SqlValue out;
    ASSERT_CODE(converter.convert_value("teradata", "VARCHAR", TypeCode::STRING, Value {"a"}, out), LOGIC_ERROR);
    ASSERT_OK(converter.open());
    ASSERT_OK(converter.convert_value("teradata", "VARCHAR", TypeCode::STRING, Value {"a"}, out));
    ASSERT_EQ(std::get<std::string>(out), "a");
}

TEST(ConverterOpenTests, RejectsInvalidOptions)
{
    DefaultDataTypeConverter converter;
    Options options;
    options.log_level = LogLevel::INFO;
    options.log_target = LogTarget::FILE;
    options.max_log_size = 0;
    ASSERT_CODE(converter.open(options), INVALID_ARGUMENT);

    options = Options {};
    options.chunk_size = 0;
    ASSERT_CODE(converter.open(options), INVALID_ARGUMENT);
}

TEST(ConverterOpenTests, ReportsUnusableLogFile)
{
    DefaultDataTypeConverter converter;
    Options options;
    options.log_level = LogLevel::INFO;
    options.log_target = LogTarget::FILE;
    options.log_prefix = "/dev/null/";
    ASSERT_CODE(converter.open(options), SYSTEM_ERROR);
}

TEST_F(ConverterTests, TypeCodeNames)
{
    ASSERT_STREQ(get_type_code_name(TypeCode::STRING), "STRING");
    ASSERT_STREQ(get_type_code_name(TypeCode::TIMESTAMP), "TIMESTAMP");
}

TEST_F(ConverterTests, NumberTypes)
{
    for (const auto *name: {"BYTEINT", "BIGINT", "DECIMAL", "DOUBLE", "DOUBLE PRECISION", "INTEGER", "NUMBER",
                            "SMALLINT", "FLOAT", "INT", "NUMERIC", "REAL"}) {
        ASSERT_EQ(m_converter.convert_type("teradata", name), TypeCode::NUMBER) << name;
    }
}

TEST_F(FloatConverterTests, FloatTypes)
{
    for (const auto *name: {"FLOAT", "DOUBLE", "DOUBLE PRECISION", "REAL"}) {
        ASSERT_EQ(m_converter.convert_type("teradata", name), TypeCode::FLOAT) << name;
    }
    ASSERT_EQ(m_converter.convert_type("teradata", "DECIMAL"), TypeCode::NUMBER);
    ASSERT_EQ(m_converter.convert_type("teradata", "INTEGER"), TypeCode::NUMBER);
}

TEST_F(ConverterTests, OtherTypes)
{
    for (const auto *name: {"BLOB", "BYTE", "GRAPHIC", "LONG VARGRAPHIC", "VARBYTE", "VARGRAPHIC"}) {
        ASSERT_EQ(m_converter.convert_type("teradata", name), TypeCode::BINARY) << name;
    }
    ASSERT_EQ(m_converter.convert_type("teradata", "DATE"), TypeCode::DATE);
    ASSERT_EQ(m_converter.convert_type("teradata", "TIME"), TypeCode::TIME);
    ASSERT_EQ(m_converter.convert_type("teradata", "TIME(6) WITH TIME ZONE"), TypeCode::TIME);
    ASSERT_EQ(m_converter.convert_type("teradata", "TIMESTAMP(0)"), TypeCode::TIMESTAMP);
    for (const auto *name: {"VARCHAR", "CHAR", "CLOB", "JSON", "INTERVAL DAY", "PERIOD(DATE)", "integer", ""}) {
        ASSERT_EQ(m_converter.convert_type("teradata", name), TypeCode::STRING) << name;
    }
}

TEST_F(ConverterTests, NullIsAlwaysNull)
{
    for (const auto *name: {"INTEGER", "FLOAT", "DATE", "VARBYTE", "INTERVAL DAY", "VARCHAR"}) {
        ASSERT_TRUE(std::holds_alternative<std::monostate>(convert(name, Value {}))) << name;
    }
}

TEST_F(ConverterTests, Numbers)
{
    auto value = convert("DECIMAL", document("10101010101010101010101.5"));
    ASSERT_EQ(std::get<Decimal>(value).to_string(), "10101010101010101010101.5");

    value = convert("INTEGER", Value {"12.50"});
    ASSERT_EQ(std::get<Decimal>(value).to_string(), "12.50");

    value = convert("FLOAT", Value {"1.#INF"});
    ASSERT_TRUE(std::get<Decimal>(value).is_infinite());
    ASSERT_FALSE(std::get<Decimal>(value).is_negative());

    value = convert("FLOAT", Value {"-1.#INF"});
    ASSERT_TRUE(std::get<Decimal>(value).is_infinite());
    ASSERT_TRUE(std::get<Decimal>(value).is_negative());

    value = convert("NUMBER", Value {"not a number"});
    ASSERT_TRUE(std::get<Decimal>(value).is_nan());

    SqlValue out;
    ASSERT_CODE(convert("INTEGER", Value {true}, out), INVALID_ARGUMENT);
}

TEST_F(FloatConverterTests, Floats)
{
    ASSERT_EQ(std::get<double>(convert("FLOAT", document("1.5"))), 1.5);
    ASSERT_EQ(std::get<double>(convert("REAL", Value {" -2.25 "})), -2.25);
    ASSERT_TRUE(std::isinf(std::get<double>(convert("DOUBLE", Value {"inf"}))));
    ASSERT_TRUE(std::isnan(std::get<double>(convert("DOUBLE", Value {"nan"}))));

    SqlValue out;
    ASSERT_CODE(convert("FLOAT", Value {"1.5x"}, out), INVALID_ARGUMENT);
    ASSERT_CODE(convert("FLOAT", Value {""}, out), INVALID_ARGUMENT);
    ASSERT_CODE(convert("FLOAT", Value {false}, out), INVALID_ARGUMENT);
}

TEST_F(ConverterTests, TemporalText)
{
    ASSERT_EQ(std::get<Date>(convert("DATE", Value {"2023-07-04"})), (Date {2023, 7, 4}));
    ASSERT_EQ(std::get<Time>(convert("TIME(6)", Value {"12:34:56.5"})).microsecond, 500'000);
    ASSERT_EQ(std::get<Timestamp>(convert("TIMESTAMP(6) WITH TIME ZONE", Value {"2023-07-04 12:34:56+02:00"})).to_string(),
              "2023-07-04 12:34:56+02:00");

    SqlValue out;
    ASSERT_CODE(convert("DATE", Value {"2023-02-29"}, out), INVALID_DATE);
    ASSERT_CODE(convert("TIME", Value {"12:34"}, out), INVALID_TIME);
    ASSERT_CODE(convert("TIMESTAMP", Value {"2023-07-04"}, out), INVALID_TIMESTAMP);
}

TEST_F(ConverterTests, TemporalEpochMilliseconds)
{
    ASSERT_EQ(std::get<Date>(convert("DATE", document("0"))), (Date {1970, 1, 1}));
    ASSERT_EQ(std::get<Time>(convert("TIME", document("3723004"))).to_string(), "01:02:03.004000");
    ASSERT_EQ(std::get<Timestamp>(convert("TIMESTAMP", document("1700000000000"))).to_string(), "2023-11-14 22:13:20");

    SqlValue out;
    ASSERT_CODE(convert("DATE", document("1.5"), out), INVALID_ARGUMENT);
    ASSERT_CODE(convert("TIMESTAMP", Value {true}, out), INVALID_ARGUMENT);
    ASSERT_CODE(convert("TIME", document("[1]"), out), INVALID_ARGUMENT);
}

TEST_F(ConverterTests, BinaryFromHex)
{
    ASSERT_EQ(std::get<Binary>(convert("VARBYTE", Value {"0aFF"})), (Binary {0x0A, 0xFF}));
    ASSERT_EQ(std::get<Binary>(convert("BLOB", Value {" 0a ff\n10 "})), (Binary {0x0A, 0xFF, 0x10}));
    ASSERT_TRUE(std::get<Binary>(convert("BYTE", Value {""})).empty());

    SqlValue out;
    auto s = convert("VARBYTE", Value {"0g"}, out);
    ASSERT_CODE(s, INVALID_ARGUMENT);
    ASSERT_TRUE(s.what().starts_with("non-hexadecimal number found at position 0"));
    ASSERT_CODE(convert("VARBYTE", Value {"abc"}, out), INVALID_ARGUMENT);
    ASSERT_CODE(convert("VARBYTE", Value {"a b"}, out), INVALID_ARGUMENT);
}

TEST_F(ConverterTests, BinaryPassesThroughNonText)
{
    const auto value = convert("VARBYTE", document("12"));
    ASSERT_EQ(std::get<Decimal>(value), Decimal::from_integer(12));
}

TEST_F(ConverterTests, Intervals)
{
    const auto value = convert("INTERVAL DAY TO SECOND", Value {"-1 02:03:04.5"});
    const auto &interval = std::get<Interval>(value);
    ASSERT_EQ(interval.type(), IntervalType::DAY_TO_SECOND);
    ASSERT_EQ(interval.to_string(), "-1 02:03:04.5");

    ASSERT_EQ(std::get<Interval>(convert("INTERVAL HOUR", Value {"5"})), Interval::hour(5));

    SqlValue out;
    ASSERT_CODE(convert("INTERVAL DAY", Value {"1 02"}, out), INVALID_INTERVAL);

    // Unrecognized subtypes are left as text.
    ASSERT_EQ(std::get<std::string>(convert("INTERVAL FORTNIGHT", Value {"1"})), "1");
}

TEST_F(ConverterTests, Json)
{
    const auto value = convert("JSON(16776192) CHARACTER SET LATIN", Value {R"({"a": [1, null]})"});
    ASSERT_EQ(std::get<Value>(value), document(R"({"a":[1,null]})"));

    SqlValue out;
    ASSERT_CODE(convert("JSON", Value {"{"}, out), CORRUPTION);
}

TEST_F(ConverterTests, Periods)
{
    auto value = convert("PERIOD(DATE)", Value {"('2020-01-01', '2020-12-31')"});
    ASSERT_EQ(std::get<DatePeriod>(value).end, (Date {2020, 12, 31}));

    value = convert("PERIOD(TIMESTAMP(6))", Value {"('2020-01-01 00:00:00', '2020-01-01 00:00:01')"});
    ASSERT_EQ(std::get<TimestampPeriod>(value).end.time.second, 1);

    SqlValue out;
    ASSERT_CODE(convert("PERIOD(DATE)", Value {"2020-01-01"}, out), INVALID_PERIOD);
}

TEST_F(ConverterTests, PassThrough)
{
    ASSERT_EQ(std::get<std::string>(convert("VARCHAR", Value {"text"})), "text");
    ASSERT_EQ(std::get<bool>(convert("VARCHAR", Value {true})), true);
    ASSERT_EQ(std::get<Decimal>(convert("CHAR", document("-3"))), Decimal::from_integer(-3));
    ASSERT_EQ(std::get<Value>(convert("VARCHAR", document("[1, 2]"))), document("[1,2]"));
    ASSERT_EQ(std::get<Value>(convert("JSON", Value {"\"text\""})), Value {"text"});
}

} // namespace
