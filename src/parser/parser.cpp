#include "parser.h"
#include "json/json.h"
#include "utils/logging.h"
#include "utils/utils.h"

namespace Tessera {

[[nodiscard]]
static auto is_single(const Slice &token, Byte c) -> bool
{
    return token.size() == 1 && token[0] == c;
}

[[nodiscard]]
static auto is_blank(const Slice &token) -> bool
{
    for (Size i {}; i < token.size(); ++i) {
        if (!is_space(token[i])) {
            return false;
        }
    }
    return true;
}

auto get_event_type_name(EventType type) -> const char *
{
    switch (type) {
        case EventType::START_OBJECT:
            return "START_OBJECT";
        case EventType::START_ARRAY:
            return "START_ARRAY";
        case EventType::FIELD_NAME:
            return "FIELD_NAME";
        case EventType::FIELD_VALUE:
            return "FIELD_VALUE";
        case EventType::ARRAY_VALUE:
            return "ARRAY_VALUE";
        case EventType::END_OBJECT:
            return "END_OBJECT";
        case EventType::END_ARRAY:
            return "END_ARRAY";
    }
    return "UNKNOWN";
}

auto Event::to_string() const -> std::string
{
    std::string out {"Event("};
    out.append(get_event_type_name(type));
    if (type == EventType::FIELD_NAME || value_type) {
        out.append(", value=");
        out.append(escape_string(value.to_string()));
    }
    if (value_type) {
        out.append(", type=");
        out.append(get_value_type_name(*value_type));
    }
    if (array_index) {
        out.append(", index=");
        append_number(out, *array_index);
    }
    if (array_length) {
        out.append(", length=");
        append_number(out, *array_length);
    }
    out.push_back(')');
    return out;
}

auto ArrayIterator::next(Value &out) -> Status
{
    if (m_parser == nullptr) {
        return Status::logic_error("array iterator is not attached to a parser");
    }
    if (m_done) {
        return Status::not_found("end of array");
    }
    auto s = m_parser->next_element(out);
    if (s.is_not_found()) {
        m_done = true;
    }
    return s;
}

Parser::Parser(const Parameters &param)
    : m_reader {*param.source, param.chunk_size},
      m_log {param.log}
{
    TESSERA_EXPECT_NE(m_log, nullptr);
    m_log->info("chunk size is {}", param.chunk_size);
}

auto Parser::fill(bool &eof) -> Status
{
    auto chunk = m_reader.read();
    if (!chunk.has_value()) {
        m_log->error("cannot read from source: {}", chunk.error().what().to_string_view());
        return chunk.error();
    }
    eof = chunk->is_empty();
    if (!eof) {
        m_log->trace("read {} bytes", chunk->size());
        m_tokenizer.reset(*chunk);
    }
    return Status::ok();
}

auto Parser::clear_value() -> void
{
    m_value = Value {};
    m_value_type.reset();
}

auto Parser::next_event(Event &out) -> Status
{
    for (;;) {
        if (!m_tokenizer.has_next()) {
            bool eof;
            Tessera_Try(fill(eof));
            if (!eof) {
                continue;
            }
            if (!m_frames.empty()) {
                return Status::incomplete_document("Reached end of input before reaching end of JSON structures.");
            }
            return Status::not_found("end of input");
        }

        const auto token = m_tokenizer.next();
        if (token.is_empty() || is_blank(token)) {
            continue;
        }

        switch (token.size() == 1 ? token[0] : '\0') {
            case '{':
                Tessera_Try(check_value_position(token));
                if (!m_frames.empty() && m_frames.back().type == FrameType::OBJECT) {
                    return Status::syntax_error("An object in an object must be preceded by a field name.");
                }
                return push(FrameType::OBJECT, {}, out);

            case '}':
                if (m_frames.empty()) {
                    return Status::syntax_error("A closing curly brace ('}') is only expected at the end of an object.");
                } else if (m_frames.back().type == FrameType::FIELD) {
                    m_tokenizer.unget();
                    std::optional<Event> event;
                    Tessera_Try(pop(event));
                    if (event) {
                        out = std::move(*event);
                        return Status::ok();
                    }
                } else if (m_frames.back().type == FrameType::OBJECT) {
                    if (m_value_type) {
                        return Status::syntax_error("Expected a colon (':') following field name: " + escape_string(m_value.to_string()));
                    }
                    std::optional<Event> event;
                    Tessera_Try(pop(event));
                    out = std::move(*event);
                    return Status::ok();
                } else {
                    return Status::syntax_error("A closing curly brace ('}') is only expected at the end of an object.");
                }
                break;

            case '[':
                Tessera_Try(check_value_position(token));
                if (!m_frames.empty() && m_frames.back().type == FrameType::OBJECT) {
                    return Status::syntax_error("An array in an object must be preceded by a field name.");
                }
                return push(FrameType::ARRAY, {}, out);

            case ']':
                if (m_frames.empty() || m_frames.back().type != FrameType::ARRAY) {
                    return Status::syntax_error("A closing bracket (']') is only expected at the end of an array.");
                } else if (m_value_type) {
                    m_tokenizer.unget();
                    std::optional<Event> event;
                    Tessera_Try(finish_array_value(event));
                    TESSERA_EXPECT_TRUE(event.has_value());
                    out = std::move(*event);
                    return Status::ok();
                } else {
                    auto &frame = m_frames.back();
                    if (frame.is_element_open()) {
                        ++frame.array_length;
                    } else if (frame.array_length > 0) {
                        return Status::syntax_error("Expected value for array element at index: " + number_to_string(frame.array_length));
                    }
                    std::optional<Event> event;
                    Tessera_Try(pop(event));
                    out = std::move(*event);
                    return Status::ok();
                }

            case ':':
                if (m_frames.empty() || m_frames.back().type != FrameType::OBJECT) {
                    return Status::syntax_error("A colon (':') can only follow a field name within an object.");
                } else if (m_value_type != ValueType::STRING || m_value.as_string().empty()) {
                    return Status::syntax_error("Name for name/value pairs cannot be empty.");
                } else {
                    auto name = m_value.as_string();
                    clear_value();
                    return push(FrameType::FIELD, std::move(name), out);
                }

            case ',': {
                std::optional<Event> event;
                if (m_frames.empty()) {
                    return Status::syntax_error("A comma (',') is only expected between fields in objects or elements of an array.");
                } else if (m_frames.back().type == FrameType::ARRAY) {
                    Tessera_Try(finish_array_value(event));
                    ++m_frames.back().array_length;
                } else if (m_frames.back().type == FrameType::FIELD) {
                    Tessera_Try(pop(event));
                } else {
                    return Status::syntax_error("A comma (',') is only expected between fields in objects or elements of an array.");
                }
                if (event) {
                    out = std::move(*event);
                    return Status::ok();
                }
                break;
            }

            default:
                if (m_value_type) {
                    return Status::syntax_error("Extra name or value found following: " + escape_string(m_value.to_string()));
                } else if (m_frames.empty()) {
                    return Status::syntax_error("Input must start with either an OBJECT ('{') or ARRAY ('['), got '" + escape_string(token) + "' instead.");
                }
                Tessera_Try(check_value_position(token));
                if (is_single(token, '"')) {
                    Tessera_Try(scan_string());
                } else {
                    if (!m_tokenizer.has_next()) {
                        // The token may continue in the next chunk.
                        m_tokenizer.set_half_token(token);
                        break;
                    }
                    Tessera_Try(scan_scalar(strip(token)));
                }
        }
    }
}

// Values may only start where a value is expected.
auto Parser::check_value_position(const Slice &token) const -> Status
{
    if (m_value_type) {
        return Status::syntax_error("Extra name or value found following: " + escape_string(m_value.to_string()));
    }
    if (!m_frames.empty()) {
        const auto &top = m_frames.back();
        if (top.type == FrameType::FIELD && top.value_type) {
            return Status::syntax_error("Extra name or value found before '" + escape_string(token) + "' in field: " + escape_string(top.name));
        } else if (top.type == FrameType::ARRAY && top.is_element_open()) {
            return Status::syntax_error("Missing comma separating array elements before: '" + escape_string(token) + "'");
        }
    }
    return Status::ok();
}

auto Parser::scan_string() -> Status
{
    std::string value;
    auto escape = false;
    for (;;) {
        if (!m_tokenizer.has_next()) {
            bool eof;
            Tessera_Try(fill(eof));
            if (eof) {
                return Status::incomplete_document("Reached end of input before reaching end of string.");
            }
            continue;
        }
        const auto token = m_tokenizer.next();
        if (token.is_empty()) {
            continue;
        } else if (escape) {
            // The token following a backslash is taken as it is.
            escape = false;
            value.append(token.data(), token.size());
        } else if (is_single(token, '"')) {
            break;
        } else if (is_single(token, '\\')) {
            escape = true;
        } else {
            value.append(token.data(), token.size());
        }
    }
    m_value = std::move(value);
    m_value_type = ValueType::STRING;
    return Status::ok();
}

auto Parser::scan_scalar(const Slice &token) -> Status
{
    TESSERA_EXPECT_FALSE(token.is_empty());
    if (is_digit(token[0]) || token[0] == '-') {
        Decimal number;
        if (!Decimal::parse(token, number).is_ok()) {
            return Status::syntax_error("Invalid number: " + escape_string(token));
        }
        m_value = std::move(number);
        m_value_type = ValueType::NUMBER;
    } else if (token == "null") {
        m_value = nullptr;
        m_value_type = ValueType::NULL_VALUE;
    } else if (token == "true") {
        m_value = true;
        m_value_type = ValueType::BOOLEAN;
    } else if (token == "false") {
        m_value = false;
        m_value_type = ValueType::BOOLEAN;
    } else {
        return Status::syntax_error("Unexpected token: " + escape_string(token));
    }
    return Status::ok();
}

auto Parser::push(FrameType type, std::string name, Event &out) -> Status
{
    Frame frame;
    frame.type = type;
    frame.name = std::move(name);

    if (!m_frames.empty()) {
        auto &parent = m_frames.back();
        frame.parent = m_frames.size() - 1;
        if (parent.type == FrameType::FIELD) {
            parent.value_type = type == FrameType::OBJECT ? ValueType::OBJECT : ValueType::ARRAY;
        } else if (parent.type == FrameType::ARRAY) {
            if (parent.is_element_open()) {
                return Status::syntax_error("Missing comma separating array elements.");
            }
            frame.array_index = parent.array_length;
            parent.last_index = static_cast<std::int64_t>(parent.array_length);
        }
    }

    out = Event {};
    out.in_array = frame.array_index.has_value();
    switch (type) {
        case FrameType::OBJECT:
            out.type = EventType::START_OBJECT;
            out.array_index = frame.array_index;
            break;
        case FrameType::ARRAY:
            out.type = EventType::START_ARRAY;
            out.array_index = frame.array_index;
            break;
        case FrameType::FIELD:
            out.type = EventType::FIELD_NAME;
            out.value = frame.name;
            break;
    }
    m_frames.emplace_back(std::move(frame));
    return Status::ok();
}

auto Parser::pop(std::optional<Event> &out) -> Status
{
    TESSERA_EXPECT_FALSE(m_frames.empty());
    auto frame = std::move(m_frames.back());
    m_frames.pop_back();

    if (!frame.value_type) {
        frame.value_type = m_value_type;
        frame.value = std::move(m_value);
    }
    clear_value();

    out.reset();
    switch (frame.type) {
        case FrameType::ARRAY:
            out.emplace();
            out->type = EventType::END_ARRAY;
            out->array_index = frame.array_index;
            out->array_length = frame.array_length;
            break;
        case FrameType::OBJECT:
            out.emplace();
            out->type = EventType::END_OBJECT;
            out->array_index = frame.array_index;
            break;
        case FrameType::FIELD:
            if (!frame.value_type) {
                return Status::syntax_error("Expected value for field: " + escape_string(frame.name));
            }
            if (*frame.value_type != ValueType::OBJECT && *frame.value_type != ValueType::ARRAY) {
                out.emplace();
                out->type = EventType::FIELD_VALUE;
                out->value = std::move(frame.value);
                out->value_type = frame.value_type;
            }
            break;
    }
    if (out) {
        out->in_array = frame.array_index.has_value();
    }
    return Status::ok();
}

auto Parser::finish_array_value(std::optional<Event> &out) -> Status
{
    TESSERA_EXPECT_FALSE(m_frames.empty());
    auto &frame = m_frames.back();
    TESSERA_EXPECT_EQ(frame.type, FrameType::ARRAY);
    out.reset();

    if (!m_value_type) {
        if (frame.is_element_open()) {
            // The element was an object or array, which has already been reported.
            return Status::ok();
        }
        return Status::syntax_error("Expected value for array element at index: " + number_to_string(frame.array_length));
    }
    out.emplace();
    out->type = EventType::ARRAY_VALUE;
    out->value = std::move(m_value);
    out->value_type = m_value_type;
    out->array_index = frame.array_length;
    out->in_array = true;
    frame.last_index = static_cast<std::int64_t>(frame.array_length);
    clear_value();
    return Status::ok();
}

auto Parser::require_event(Event &out, const char *what) -> Status
{
    auto s = next_event(out);
    if (s.is_not_found()) {
        return Status::unexpected_element(std::string {"Expected "} + what + " but reached the end of the input.");
    }
    return s;
}

auto Parser::expect_object() -> Status
{
    Event event;
    Tessera_Try(require_event(event, "START_OBJECT"));
    if (event.type != EventType::START_OBJECT) {
        return Status::unexpected_element("Expected START_OBJECT but got: " + event.to_string());
    }
    return Status::ok();
}

auto Parser::expect_array(ArrayIterator &out) -> Status
{
    Event event;
    Tessera_Try(require_event(event, "START_ARRAY"));
    if (event.type != EventType::START_ARRAY) {
        return Status::unexpected_element("Expected START_ARRAY but got: " + event.to_string());
    }
    out = ArrayIterator {*this};
    return Status::ok();
}

auto Parser::expect_field(const Slice &name, Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status
{
    Event event;
    Tessera_Try(require_event(event, "FIELD_NAME"));
    if (event.type != EventType::FIELD_NAME) {
        return Status::unexpected_element("Expected FIELD_NAME but got: " + event.to_string());
    }
    if (event.value.as_string() != name.to_string_view()) {
        return Status::unexpected_element("Expected " + escape_string(name) + " field but got " +
                                          escape_string(event.value.as_string()) + " instead.");
    }
    return expect_value(EventType::FIELD_VALUE, type, allow_null, read_all, out);
}

auto Parser::expect_array_value(Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status
{
    return expect_value(EventType::ARRAY_VALUE, type, allow_null, read_all, out);
}

auto Parser::expect_value(EventType type, std::optional<ValueType> value_type, bool allow_null, bool read_all, Element &out) -> Status
{
    Event event;
    Tessera_Try(require_event(event, get_event_type_name(type)));

    if (event.type == type) {
        TESSERA_EXPECT_TRUE(event.value_type.has_value());
        if (allow_null && event.value_type == ValueType::NULL_VALUE) {
            out = Value {};
        } else if (value_type && event.value_type != value_type) {
            return Status::unexpected_element(std::string {"Expected "} + get_value_type_name(*value_type) + " but got " +
                                              get_value_type_name(*event.value_type) + " instead.");
        } else {
            out = std::move(event.value);
        }
        return Status::ok();
    }

    if (type == EventType::ARRAY_VALUE && !event.in_array &&
        (event.type == EventType::START_OBJECT || event.type == EventType::START_ARRAY)) {
        return Status::unexpected_element("Expected array element but not in an array.");
    }

    if (event.type == EventType::START_OBJECT) {
        if (value_type && value_type != ValueType::OBJECT) {
            return Status::unexpected_element(std::string {"Expected "} + get_value_type_name(*value_type) + " but got an object instead.");
        }
        if (!value_type || read_all) {
            Value object;
            Tessera_Try(read_object(event, object));
            out = std::move(object);
        } else {
            // The caller walks the object.
            out = Value {};
        }
        return Status::ok();
    }

    if (event.type == EventType::START_ARRAY) {
        if (value_type && value_type != ValueType::ARRAY) {
            return Status::unexpected_element(std::string {"Expected "} + get_value_type_name(*value_type) + " but got an array instead.");
        }
        if (!value_type || read_all) {
            Value array;
            Tessera_Try(read_array(event, array));
            out = std::move(array);
        } else {
            out = ArrayIterator {*this};
        }
        return Status::ok();
    }
    return Status::unexpected_element("Unexpected event: " + event.to_string());
}

auto Parser::read_object(Value &out) -> Status
{
    Event event;
    Tessera_Try(next_event(event));
    return read_object(event, out);
}

auto Parser::read_array(Value &out) -> Status
{
    Event event;
    Tessera_Try(next_event(event));
    return read_array(event, out);
}

auto Parser::read_object(const Event &start, Value &out) -> Status
{
    if (start.type != EventType::START_OBJECT) {
        return Status::unexpected_element(std::string {"Expected START_OBJECT but got "} + get_event_type_name(start.type) + " instead.");
    }
    return materialize(start, out);
}

auto Parser::read_array(const Event &start, Value &out) -> Status
{
    if (start.type != EventType::START_ARRAY) {
        return Status::unexpected_element(std::string {"Expected START_ARRAY but got "} + get_event_type_name(start.type) + " instead.");
    }
    return materialize(start, out);
}

auto Parser::materialize(const Event &start, Value &out) -> Status
{
    const auto is_object = start.type == EventType::START_OBJECT;
    const auto frame_type = is_object ? FrameType::OBJECT : FrameType::ARRAY;
    if (m_frames.empty() || m_frames.back().type != frame_type) {
        return Status::logic_error("event does not belong to the innermost open structure");
    }
    const auto open = is_object ? '{' : '[';
    const auto close = is_object ? '}' : ']';

    // Collect the raw text up to the matching closing delimiter. Delimiters inside strings don't count.
    std::string text(1, open);
    Size depth {1};
    auto in_string = false;
    auto in_escape = false;

    while (depth) {
        if (!m_tokenizer.has_next()) {
            bool eof;
            Tessera_Try(fill(eof));
            if (eof) {
                return Status::incomplete_document("Reached end of input before reaching end of JSON structures.");
            }
            continue;
        }
        const auto token = m_tokenizer.next();
        text.append(token.data(), token.size());
        if (token.is_empty()) {
            continue;
        } else if (in_string) {
            if (in_escape) {
                in_escape = false;
            } else if (is_single(token, '"')) {
                in_string = false;
            } else if (is_single(token, '\\')) {
                in_escape = true;
            }
        } else if (is_single(token, '"')) {
            in_string = true;
        } else if (is_single(token, open)) {
            ++depth;
        } else if (is_single(token, close)) {
            --depth;
        }
    }
    m_log->trace("materializing {} of {} bytes", is_object ? "object" : "array", text.size());

    if (auto s = Json::decode(text, out); !s.is_ok()) {
        return Status::syntax_error(s.what());
    }
    std::optional<Event> end;
    return pop(end);
}

auto Parser::next_element(Value &out) -> Status
{
    Event event;
    Tessera_Try(require_event(event, "array element"));
    switch (event.type) {
        case EventType::START_OBJECT:
            return read_object(event, out);
        case EventType::START_ARRAY:
            return read_array(event, out);
        case EventType::ARRAY_VALUE:
            out = std::move(event.value);
            return Status::ok();
        case EventType::END_ARRAY:
            return Status::not_found("end of array");
        default:
            return Status::unexpected_element("Unexpected event: " + event.to_string());
    }
}

} // namespace Tessera
