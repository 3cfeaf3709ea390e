#include <cstdlib>
#include <memory>
#include <vector>
#include <spdlog/fmt/fmt.h>
#include <tessera/tessera.h>

#define USAGE_ASSERT_OK(s) \
    do { \
        if (!(s).is_ok()) { \
            fmt::print(stderr, "{}\n", (s).what().to_string()); \
            std::exit(EXIT_FAILURE); \
        } \
    } while (0)

namespace {

using namespace Tessera;

constexpr auto SAMPLE = R"j({"queueDuration": 3, "queryDuration": 18, "results": [
  {"resultSet": true,
   "columns": [{"name": "name", "type": "VARCHAR"}, {"name": "born", "type": "DATE"},
               {"name": "weight", "type": "DECIMAL(5,2)"}, {"name": "nap", "type": "INTERVAL HOUR TO MINUTE"}],
   "data": [["lilly", "2016-04-02", 4.25, "3:30"], ["freya", null, "5.10", "-0:45"]]},
  {"resultSet": false, "count": 2}]})j";

struct Printer {
    auto operator()(std::monostate) const -> std::string
    {
        return "NULL";
    }

    auto operator()(bool b) const -> std::string
    {
        return b ? "true" : "false";
    }

    auto operator()(double d) const -> std::string
    {
        return fmt::format("{}", d);
    }

    auto operator()(const std::string &s) const -> std::string
    {
        return '\'' + s + '\'';
    }

    auto operator()(const Binary &b) const -> std::string
    {
        std::string out {"x'"};
        for (const auto byte: b) {
            out += fmt::format("{:02X}", byte);
        }
        return out + '\'';
    }

    auto operator()(const Value &v) const -> std::string
    {
        return v.to_string();
    }

    // Decimal, temporal, interval, and period values all know how to format themselves.
    template<class T>
    auto operator()(const T &t) const -> std::string
    {
        return t.to_string();
    }
};

} // namespace

auto main(int argc, const char *argv[]) -> int
{
    // Read the response from a file if one is given, otherwise use the sample.
    std::unique_ptr<Source> source;
    if (argc > 1) {
        FileSource *file;
        auto s = FileSource::open(argv[1], &file);
        USAGE_ASSERT_OK(s);
        source.reset(file);
    } else {
        source = std::make_unique<StringSource>(SAMPLE);
    }

    Options options;
    options.chunk_size = 0x1000;
    options.log_level = LogLevel::INFO;
    options.log_target = LogTarget::STDERR_COLOR;

    PullParser parser;
    auto s = parser.open(*source, options);
    USAGE_ASSERT_OK(s);
    DefaultDataTypeConverter converter;
    s = converter.open(options);
    USAGE_ASSERT_OK(s);

    s = parser.expect_object();
    USAGE_ASSERT_OK(s);

    Element element;
    for (const auto *name: {"queueDuration", "queryDuration"}) {
        s = parser.expect_field(name, element, ValueType::NUMBER);
        USAGE_ASSERT_OK(s);
        fmt::print("{}: {} ms\n", name, std::get<Value>(element).to_string());
    }

    // Each result is either a result set or an update count. Both are walked without reading the whole
    // result into memory.
    Element results;
    s = parser.expect_field("results", results, ValueType::ARRAY);
    USAGE_ASSERT_OK(s);

    for (Size index {};; ++index) {
        Event event;
        s = parser.next_event(event);
        USAGE_ASSERT_OK(s);
        if (event.type == EventType::END_ARRAY) {
            break;
        }

        s = parser.expect_field("resultSet", element, ValueType::BOOLEAN);
        USAGE_ASSERT_OK(s);
        if (!std::get<Value>(element).as_boolean()) {
            s = parser.expect_field("count", element, ValueType::NUMBER);
            USAGE_ASSERT_OK(s);
            fmt::print("result {}: {} row(s) affected\n", index, std::get<Value>(element).to_string());
        } else {
            s = parser.expect_field("columns", element, ValueType::ARRAY, false, true);
            USAGE_ASSERT_OK(s);
            std::vector<std::pair<std::string, TypeCode>> columns;
            for (const auto &column: std::get<Value>(element).as_array()) {
                const auto &type = column.as_object().at("type").as_string();
                columns.emplace_back(type, converter.convert_type("teradata", type));
                fmt::print("column {} {} -> {}\n", column.as_object().at("name").as_string(), type,
                           get_type_code_name(columns.back().second));
            }

            s = parser.expect_field("data", element, ValueType::ARRAY);
            USAGE_ASSERT_OK(s);
            auto &rows = std::get<ArrayIterator>(element);
            Value row;
            while ((s = rows.next(row)).is_ok()) {
                std::string line;
                for (Size i {}; i < columns.size(); ++i) {
                    SqlValue value;
                    s = converter.convert_value("teradata", columns[i].first, columns[i].second, row.as_array()[i], value);
                    USAGE_ASSERT_OK(s);
                    line += (i ? ", " : "") + std::visit(Printer {}, value);
                }
                fmt::print("({})\n", line);
            }
            if (!s.is_not_found()) {
                USAGE_ASSERT_OK(s);
            }
        }

        s = parser.next_event(event);
        USAGE_ASSERT_OK(s);
        if (event.type != EventType::END_OBJECT) {
            fmt::print(stderr, "unexpected event {}\n", event.to_string());
            return EXIT_FAILURE;
        }
    }
    return EXIT_SUCCESS;
}
