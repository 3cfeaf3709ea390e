#include <gtest/gtest.h>
#include "harness.h"
#include "tessera/tessera.h"

namespace {

using namespace Tessera;

constexpr auto RESPONSE = R"({
  "queueDuration": 7,
  "queryDuration": 42,
  "results": [
    {
      "resultSet": true,
      "columns": [
        {"name": "id", "type": "INTEGER"},
        {"name": "born", "type": "DATE"},
        {"name": "photo", "type": "VARBYTE"},
        {"name": "wait", "type": "INTERVAL HOUR TO MINUTE"},
        {"name": "note", "type": "VARCHAR"},
        {"name": "score", "type": "FLOAT"}
      ],
      "data": [
        [1, "1990-05-17", "cafe", "-1:30", "x, [y] {z}", 2.5],
        [2, null, "00", "10:00", null, "1.#INF"]
      ]
    },
    {
      "resultSet": false,
      "count": 3
    }
  ]
})";

struct Column {
    std::string name;
    std::string type;
    TypeCode code {};
};

class ResponseTests : public testing::TestWithParam<Size> {
protected:
    ResponseTests()
        : source {RESPONSE}
    {
        Options options;
        options.chunk_size = GetParam();
        EXPECT_OK(parser.open(source, options));
        EXPECT_OK(converter.open(options));
    }

    ~ResponseTests() override = default;

    auto field(const char *name, std::optional<ValueType> type = std::nullopt, bool read_all = false) -> Value
    {
        Element element;
        EXPECT_OK(parser.expect_field(name, element, type, false, read_all));
        EXPECT_TRUE(std::holds_alternative<Value>(element));
        return std::holds_alternative<Value>(element) ? std::get<Value>(element) : Value {};
    }

    auto assert_event(EventType type) -> void
    {
        Event event;
        ASSERT_OK(parser.next_event(event));
        ASSERT_EQ(event.type, type) << event.to_string();
    }

    auto read_columns() -> std::vector<Column>
    {
        std::vector<Column> columns;
        const auto value = field("columns", ValueType::ARRAY, true);
        for (const auto &column: value.as_array()) {
            const auto &object = column.as_object();
            Column c;
            c.name = object.at("name").as_string();
            c.type = object.at("type").as_string();
            c.code = converter.convert_type("teradata", c.type);
            columns.emplace_back(std::move(c));
        }
        return columns;
    }

    StringSource source;
    PullParser parser;
    DefaultDataTypeConverter converter;
};

TEST_P(ResponseTests, WalksResponse)
{
    ASSERT_OK(parser.expect_object());
    ASSERT_EQ(field("queueDuration", ValueType::NUMBER), Value {Decimal::from_integer(7)});
    ASSERT_EQ(field("queryDuration", ValueType::NUMBER), Value {Decimal::from_integer(42)});

    Element element;
    ASSERT_OK(parser.expect_field("results", element, ValueType::ARRAY));
    ASSERT_TRUE(std::holds_alternative<ArrayIterator>(element));
    auto &results = std::get<ArrayIterator>(element);

    // First result: a result set. Rows are converted one at a time.
    Element result;
    ASSERT_OK(parser.expect_array_value(result, ValueType::OBJECT));
    ASSERT_TRUE(field("resultSet", ValueType::BOOLEAN).as_boolean());
    const auto columns = read_columns();
    ASSERT_EQ(columns.size(), 6);
    ASSERT_EQ(columns[1].code, TypeCode::DATE);
    ASSERT_EQ(columns[2].code, TypeCode::BINARY);
    ASSERT_EQ(columns[3].code, TypeCode::STRING);

    Element data;
    ASSERT_OK(parser.expect_field("data", data, ValueType::ARRAY));
    auto &rows = std::get<ArrayIterator>(data);
    std::vector<std::vector<SqlValue>> table;
    for (;;) {
        Value row;
        auto s = rows.next(row);
        if (s.is_not_found()) {
            break;
        }
        ASSERT_OK(s);
        ASSERT_EQ(row.as_array().size(), columns.size());
        std::vector<SqlValue> converted;
        for (Size i {}; i < columns.size(); ++i) {
            SqlValue value;
            ASSERT_OK(converter.convert_value("teradata", columns[i].type, columns[i].code, row.as_array()[i], value));
            converted.emplace_back(std::move(value));
        }
        table.emplace_back(std::move(converted));
    }
    ASSERT_TRUE(rows.is_done());
    ASSERT_EQ(table.size(), 2);

    ASSERT_EQ(std::get<Decimal>(table[0][0]), Decimal::from_integer(1));
    ASSERT_EQ(std::get<Date>(table[0][1]).to_string(), "1990-05-17");
    ASSERT_EQ(std::get<Binary>(table[0][2]), (Binary {0xCA, 0xFE}));
    ASSERT_EQ(std::get<Interval>(table[0][3]), Interval::hour_to_minute(1, 30, true));
    ASSERT_EQ(std::get<std::string>(table[0][4]), "x, [y] {z}");
    ASSERT_EQ(std::get<Decimal>(table[0][5]).to_string(), "2.5");

    ASSERT_TRUE(std::holds_alternative<std::monostate>(table[1][1]));
    ASSERT_EQ(std::get<Binary>(table[1][2]), (Binary {0x00}));
    ASSERT_EQ(std::get<Interval>(table[1][3]).to_string(), "10:00");
    ASSERT_TRUE(std::holds_alternative<std::monostate>(table[1][4]));
    ASSERT_TRUE(std::get<Decimal>(table[1][5]).is_infinite());
    assert_event(EventType::END_OBJECT);

    // Second result: an update count.
    ASSERT_OK(parser.expect_array_value(result, ValueType::OBJECT));
    ASSERT_FALSE(field("resultSet", ValueType::BOOLEAN).as_boolean());
    ASSERT_EQ(field("count", ValueType::NUMBER), Value {Decimal::from_integer(3)});
    assert_event(EventType::END_OBJECT);

    Value extra;
    ASSERT_CODE(results.next(extra), NOT_FOUND);
    ASSERT_TRUE(results.is_done());
    assert_event(EventType::END_OBJECT);

    Event event;
    ASSERT_CODE(parser.next_event(event), NOT_FOUND);
}

TEST_P(ResponseTests, MaterializesResults)
{
    ASSERT_OK(parser.expect_object());
    (void)field("queueDuration");
    (void)field("queryDuration");
    const auto results = field("results", ValueType::ARRAY, true);
    ASSERT_EQ(results.as_array().size(), 2);
    const auto &first = results.as_array()[0].as_object();
    ASSERT_EQ(first.at("data").as_array()[0].as_array()[4], Value {"x, [y] {z}"});
    ASSERT_EQ(results.as_array()[1].as_object().at("count"), Value {Decimal::from_integer(3)});
    assert_event(EventType::END_OBJECT);
}

INSTANTIATE_TEST_SUITE_P(
    ResponseTests,
    ResponseTests,
    ::testing::Values(1, 2, 7, 64, DEFAULT_CHUNK_SIZE));

} // namespace
