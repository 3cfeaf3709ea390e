#include "parser.h"
#include "utils/utils.h"

namespace Tessera {

PullParser::PullParser() = default;

PullParser::~PullParser() = default;

PullParser::PullParser(PullParser &&) noexcept = default;

auto PullParser::operator=(PullParser &&) noexcept -> PullParser & = default;

auto PullParser::open(Source &source, const Options &options) -> Status
{
    Tessera_Try(validate_options(options));

    Parser::Parameters param;
    param.source = &source;
    param.chunk_size = options.chunk_size;
    try {
        System system {options.log_prefix.to_string(), options};
        param.log = system.create_log("parser");
    } catch (const spdlog::spdlog_ex &error) {
        return Status::system_error(error.what());
    }
    m_parser = std::make_unique<Parser>(param);
    return Status::ok();
}

#define CHECK_OPEN \
    do { \
        if (m_parser == nullptr) { \
            return Status::logic_error("parser is not open"); \
        } \
    } while (0)

auto PullParser::next_event(Event &out) -> Status
{
    CHECK_OPEN;
    return m_parser->next_event(out);
}

auto PullParser::expect_object() -> Status
{
    CHECK_OPEN;
    return m_parser->expect_object();
}

auto PullParser::expect_array(ArrayIterator &out) -> Status
{
    CHECK_OPEN;
    return m_parser->expect_array(out);
}

auto PullParser::expect_field(const Slice &name, Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status
{
    CHECK_OPEN;
    return m_parser->expect_field(name, out, type, allow_null, read_all);
}

auto PullParser::expect_array_value(Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status
{
    CHECK_OPEN;
    return m_parser->expect_array_value(out, type, allow_null, read_all);
}

auto PullParser::read_object(Value &out) -> Status
{
    CHECK_OPEN;
    return m_parser->read_object(out);
}

auto PullParser::read_array(Value &out) -> Status
{
    CHECK_OPEN;
    return m_parser->read_array(out);
}

auto PullParser::read_object(const Event &start, Value &out) -> Status
{
    CHECK_OPEN;
    return m_parser->read_object(start, out);
}

auto PullParser::read_array(const Event &start, Value &out) -> Status
{
    CHECK_OPEN;
    return m_parser->read_array(start, out);
}

#undef CHECK_OPEN

} // namespace Tessera
