#include "tessera/value.h"
#include <cstdio>
#include "utils/utils.h"

namespace Tessera {

auto get_value_type_name(ValueType type) -> const char *
{
    switch (type) {
        case ValueType::STRING:
            return "STRING";
        case ValueType::NUMBER:
            return "NUMBER";
        case ValueType::BOOLEAN:
            return "BOOLEAN";
        case ValueType::NULL_VALUE:
            return "NULL";
        case ValueType::OBJECT:
            return "OBJECT";
        case ValueType::ARRAY:
            return "ARRAY";
    }
    return "UNKNOWN";
}

auto Value::type() const -> ValueType
{
    if (is_string()) {
        return ValueType::STRING;
    } else if (is_number()) {
        return ValueType::NUMBER;
    } else if (is_boolean()) {
        return ValueType::BOOLEAN;
    } else if (is_array()) {
        return ValueType::ARRAY;
    } else if (is_object()) {
        return ValueType::OBJECT;
    }
    return ValueType::NULL_VALUE;
}

auto Value::as_boolean() const -> bool
{
    TESSERA_EXPECT_TRUE(is_boolean());
    return std::get<bool>(m_data);
}

auto Value::as_number() const -> const Decimal &
{
    TESSERA_EXPECT_TRUE(is_number());
    return std::get<Decimal>(m_data);
}

auto Value::as_string() const -> const std::string &
{
    TESSERA_EXPECT_TRUE(is_string());
    return std::get<std::string>(m_data);
}

auto Value::as_array() const -> const Array &
{
    TESSERA_EXPECT_TRUE(is_array());
    return std::get<Array>(m_data);
}

auto Value::as_object() const -> const Object &
{
    TESSERA_EXPECT_TRUE(is_object());
    return std::get<Object>(m_data);
}

auto Value::as_array() -> Array &
{
    TESSERA_EXPECT_TRUE(is_array());
    return std::get<Array>(m_data);
}

auto Value::as_object() -> Object &
{
    TESSERA_EXPECT_TRUE(is_object());
    return std::get<Object>(m_data);
}

static auto append_quoted(std::string &out, const std::string &s) -> void
{
    out.push_back('"');
    for (const auto c: s) {
        switch (c) {
            case '"':
                out.append("\\\"");
                break;
            case '\\':
                out.append("\\\\");
                break;
            case '\b':
                out.append("\\b");
                break;
            case '\f':
                out.append("\\f");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buffer[8];
                    std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(c));
                    out.append(buffer);
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
}

static auto append_value(std::string &out, const Value &value) -> void
{
    switch (value.type()) {
        case ValueType::NULL_VALUE:
            out.append("null");
            break;
        case ValueType::BOOLEAN:
            out.append(value.as_boolean() ? "true" : "false");
            break;
        case ValueType::NUMBER:
            out.append(value.as_number().to_string());
            break;
        case ValueType::STRING:
            append_quoted(out, value.as_string());
            break;
        case ValueType::ARRAY: {
            out.push_back('[');
            auto first = true;
            for (const auto &element: value.as_array()) {
                if (!first) {
                    out.push_back(',');
                }
                append_value(out, element);
                first = false;
            }
            out.push_back(']');
            break;
        }
        case ValueType::OBJECT: {
            out.push_back('{');
            auto first = true;
            for (const auto &[key, member]: value.as_object()) {
                if (!first) {
                    out.push_back(',');
                }
                append_quoted(out, key);
                out.push_back(':');
                append_value(out, member);
                first = false;
            }
            out.push_back('}');
            break;
        }
    }
}

auto Value::to_string() const -> std::string
{
    std::string out;
    append_value(out, *this);
    return out;
}

auto operator==(const Value &lhs, const Value &rhs) -> bool
{
    return lhs.m_data == rhs.m_data;
}

auto operator!=(const Value &lhs, const Value &rhs) -> bool
{
    return !(lhs == rhs);
}

} // namespace Tessera
