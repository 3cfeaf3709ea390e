#include <gtest/gtest.h>
#include "harness.h"
#include "tessera/parser.h"
#include "tessera/source.h"

namespace {

using namespace Tessera;

class HelperTests: public testing::Test {
protected:
    auto open(const std::string &text, Size chunk_size = DEFAULT_CHUNK_SIZE) -> void
    {
        source = std::make_unique<StringSource>(text);
        Options options;
        options.chunk_size = chunk_size;
        ASSERT_OK(parser.open(*source, options));
    }

    auto field(const std::string &name, std::optional<ValueType> type = std::nullopt, bool allow_null = false, bool read_all = false) -> Value
    {
        Element element;
        EXPECT_OK(parser.expect_field(name, element, type, allow_null, read_all));
        EXPECT_TRUE(std::holds_alternative<Value>(element));
        return std::holds_alternative<Value>(element) ? std::get<Value>(element) : Value {};
    }

    std::unique_ptr<StringSource> source;
    PullParser parser;
};

auto number(std::int64_t value) -> Value
{
    return Decimal::from_integer(value);
}

TEST_F(HelperTests, ExpectsFieldsInOrder)
{
    open(R"({"a": 1, "b": "two", "c": true, "d": null})");
    ASSERT_OK(parser.expect_object());
    ASSERT_EQ(field("a", ValueType::NUMBER), number(1));
    ASSERT_EQ(field("b", ValueType::STRING), Value {"two"});
    ASSERT_EQ(field("c"), Value {true});
    ASSERT_TRUE(field("d", ValueType::STRING, true).is_null());
}

TEST_F(HelperTests, WrongFieldName)
{
    open(R"({"a": 1})");
    ASSERT_OK(parser.expect_object());
    Element element;
    ASSERT_CODE(parser.expect_field("b", element), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, WrongValueType)
{
    open(R"({"a": 1})");
    ASSERT_OK(parser.expect_object());
    Element element;
    ASSERT_CODE(parser.expect_field("a", element, ValueType::STRING), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, NullRequiresPermission)
{
    open(R"({"a": null})");
    ASSERT_OK(parser.expect_object());
    Element element;
    ASSERT_CODE(parser.expect_field("a", element, ValueType::STRING), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ExpectObjectFailsOnArray)
{
    open("[1]");
    ASSERT_CODE(parser.expect_object(), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ExpectArrayFailsOnObject)
{
    open("{}");
    ArrayIterator itr;
    ASSERT_CODE(parser.expect_array(itr), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ExpectationAtEndOfInput)
{
    open("");
    ASSERT_CODE(parser.expect_object(), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ExpectFieldOnNonField)
{
    open("[1]");
    Element element;
    ASSERT_CODE(parser.expect_field("a", element), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ObjectFieldIsMaterializedByDefault)
{
    open(R"({"o": {"x": [1, {"y": "z"}], "w": null}, "n": 2})");
    ASSERT_OK(parser.expect_object());
    const auto o = field("o");
    ASSERT_TRUE(o.is_object());
    ASSERT_EQ(o.as_object().size(), 2);
    const auto &x = o.as_object().at("x").as_array();
    ASSERT_EQ(x.size(), 2);
    ASSERT_EQ(x[0], number(1));
    ASSERT_EQ(x[1].as_object().at("y"), Value {"z"});
    ASSERT_TRUE(o.as_object().at("w").is_null());
    ASSERT_EQ(field("n"), number(2));
}

TEST_F(HelperTests, ObjectFieldCanBeLeftOpen)
{
    open(R"({"o": {"x": 1}, "y": 2})");
    ASSERT_OK(parser.expect_object());
    ASSERT_TRUE(field("o", ValueType::OBJECT).is_null());
    ASSERT_EQ(field("x", ValueType::NUMBER), number(1));
    Event event;
    ASSERT_OK(parser.next_event(event));
    ASSERT_EQ(event.type, EventType::END_OBJECT);
    ASSERT_EQ(field("y", ValueType::NUMBER), number(2));
}

TEST_F(HelperTests, ObjectFieldWithReadAll)
{
    open(R"({"o": {"x": 1}})");
    ASSERT_OK(parser.expect_object());
    const auto o = field("o", ValueType::OBJECT, false, true);
    ASSERT_EQ(o.as_object().at("x"), number(1));
}

TEST_F(HelperTests, ContainerOfWrongType)
{
    open(R"({"o": {"x": 1}})");
    ASSERT_OK(parser.expect_object());
    Element element;
    ASSERT_CODE(parser.expect_field("o", element, ValueType::ARRAY), UNEXPECTED_ELEMENT);

    open(R"({"a": [1]})");
    ASSERT_OK(parser.expect_object());
    ASSERT_CODE(parser.expect_field("a", element, ValueType::STRING), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ArrayFieldProducesIterator)
{
    open(R"({"a": [1, "b", [2, 3], {"c": null}], "d": 4})");
    ASSERT_OK(parser.expect_object());
    Element element;
    ASSERT_OK(parser.expect_field("a", element, ValueType::ARRAY));
    ASSERT_TRUE(std::holds_alternative<ArrayIterator>(element));
    auto &itr = std::get<ArrayIterator>(element);

    Value value;
    ASSERT_OK(itr.next(value));
    ASSERT_EQ(value, number(1));
    ASSERT_OK(itr.next(value));
    ASSERT_EQ(value, Value {"b"});
    ASSERT_OK(itr.next(value));
    ASSERT_EQ(value, (Value {Value::Array {number(2), number(3)}}));
    ASSERT_OK(itr.next(value));
    ASSERT_TRUE(value.as_object().at("c").is_null());
    ASSERT_FALSE(itr.is_done());
    ASSERT_TRUE(itr.next(value).is_not_found());
    ASSERT_TRUE(itr.is_done());
    ASSERT_TRUE(itr.next(value).is_not_found());

    ASSERT_EQ(field("d"), number(4));
}

TEST_F(HelperTests, ArrayFieldWithReadAll)
{
    open(R"({"a": [1, [2]]})");
    ASSERT_OK(parser.expect_object());
    const auto a = field("a", ValueType::ARRAY, false, true);
    ASSERT_EQ(a, (Value {Value::Array {number(1), Value {Value::Array {number(2)}}}}));
}

TEST_F(HelperTests, UntypedArrayFieldIsMaterialized)
{
    open(R"({"a": []})");
    ASSERT_OK(parser.expect_object());
    const auto a = field("a");
    ASSERT_TRUE(a.is_array());
    ASSERT_TRUE(a.as_array().empty());
}

TEST_F(HelperTests, ExpectArrayValues)
{
    open(R"([1, null, {"x": 2}, [3]])");
    ArrayIterator itr;
    ASSERT_OK(parser.expect_array(itr));

    Element element;
    ASSERT_OK(parser.expect_array_value(element, ValueType::NUMBER));
    ASSERT_EQ(std::get<Value>(element), number(1));
    ASSERT_OK(parser.expect_array_value(element, ValueType::STRING, true));
    ASSERT_TRUE(std::get<Value>(element).is_null());
    ASSERT_OK(parser.expect_array_value(element));
    ASSERT_EQ(std::get<Value>(element).as_object().at("x"), number(2));
    ASSERT_OK(parser.expect_array_value(element, ValueType::ARRAY));
    ASSERT_TRUE(std::holds_alternative<ArrayIterator>(element));

    Value value;
    auto &inner = std::get<ArrayIterator>(element);
    ASSERT_OK(inner.next(value));
    ASSERT_EQ(value, number(3));
    ASSERT_TRUE(inner.next(value).is_not_found());
    ASSERT_TRUE(itr.next(value).is_not_found());
}

TEST_F(HelperTests, ArrayValueOutsideOfArray)
{
    open(R"({"a": {}})");
    ASSERT_OK(parser.expect_object());
    Event event;
    ASSERT_OK(parser.next_event(event));
    ASSERT_EQ(event.type, EventType::FIELD_NAME);
    Element element;
    ASSERT_CODE(parser.expect_array_value(element), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ReadObject)
{
    open(R"({"key1":[0,1,2,3,4,{"value":"5"}], "key2":
            {"key1":[0,1,2,3,4,{"value":"5"}]}})");
    Value value;
    ASSERT_OK(parser.read_object(value));
    ASSERT_EQ(value.as_object().size(), 2);

    const auto *object = &value.as_object();
    for (int depth {}; depth < 2; ++depth) {
        const auto &key1 = object->at("key1").as_array();
        ASSERT_EQ(key1.size(), 6);
        for (int i {}; i < 5; ++i) {
            ASSERT_EQ(key1[i], number(i));
        }
        ASSERT_EQ(key1[5].as_object().at("value"), Value {"5"});
        if (depth == 0) {
            object = &object->at("key2").as_object();
            ASSERT_EQ(object->size(), 1);
        }
    }
}

TEST_F(HelperTests, ReadArray)
{
    open("[0,1,2,3,4,[0,1,2,3,4,[0,1,2,3,4]],[0,1,2,3,4]]");
    Value value;
    ASSERT_OK(parser.read_array(value));
    const auto &array = value.as_array();
    ASSERT_EQ(array.size(), 7);
    for (int i {}; i < 5; ++i) {
        ASSERT_EQ(array[i], number(i));
        ASSERT_EQ(array[5].as_array()[i], number(i));
        ASSERT_EQ(array[5].as_array()[5].as_array()[i], number(i));
        ASSERT_EQ(array[6].as_array()[i], number(i));
    }
}

TEST_F(HelperTests, ReadArraySyntaxError)
{
    open("[[0,1][0,1]]");
    Value value;
    ASSERT_CODE(parser.read_array(value), SYNTAX_ERROR);
}

TEST_F(HelperTests, ReadObjectOnArray)
{
    open("[]");
    Value value;
    ASSERT_CODE(parser.read_object(value), UNEXPECTED_ELEMENT);
}

TEST_F(HelperTests, ReadIncompleteObject)
{
    open(R"({"a": [1, 2)");
    Value value;
    ASSERT_CODE(parser.read_object(value), INCOMPLETE_DOCUMENT);
}

TEST_F(HelperTests, MaterializedStringsDecodeEscapes)
{
    open(R"({"a": "x\ny\u0041\"", "b": "\ud83d\ude00"})");
    Value value;
    ASSERT_OK(parser.read_object(value));
    ASSERT_EQ(value.as_object().at("a"), Value {"x\nyA\""});
    ASSERT_EQ(value.as_object().at("b"), Value {"\xF0\x9F\x98\x80"});
}

TEST_F(HelperTests, ReadFromStartEvent)
{
    open(R"([{"a": 1}, 2])");
    Event event;
    ASSERT_OK(parser.next_event(event));
    ASSERT_OK(parser.next_event(event));
    ASSERT_EQ(event.type, EventType::START_OBJECT);

    Value value;
    ASSERT_OK(parser.read_object(event, value));
    ASSERT_EQ(value.as_object().at("a"), number(1));
    ASSERT_OK(parser.next_event(event));
    ASSERT_EQ(event.type, EventType::ARRAY_VALUE);
    ASSERT_EQ(event.array_index, 1);
}

TEST_F(HelperTests, IterateArrayWithDelimitersInStrings)
{
    // Every chunk size must find the same element boundaries.
    for (Size chunk_size: {1, 2, 3, 5, 8, 100}) {
        open(R"([{"key0}":["}\"","\"}","}"]}, {"key1}":["}","\"}","}"]}, )"
             R"({"key2}":["}","}","\"}"]}])", chunk_size);
        ArrayIterator itr;
        ASSERT_OK(parser.expect_array(itr));

        Value value;
        int i {};
        auto s = Status::ok();
        while ((s = itr.next(value)).is_ok()) {
            const auto key = "key" + std::to_string(i) + "}";
            ASSERT_EQ(value.as_object().at(key).as_array().size(), 3) << "chunk size " << chunk_size;
            ++i;
        }
        ASSERT_TRUE(s.is_not_found());
        ASSERT_EQ(i, 3);
    }
}

} // namespace
