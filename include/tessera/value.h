#ifndef TESSERA_VALUE_H
#define TESSERA_VALUE_H

#include <map>
#include <string>
#include <variant>
#include <vector>
#include "decimal.h"

namespace Tessera {

enum class ValueType {
    STRING,
    NUMBER,
    BOOLEAN,
    NULL_VALUE,
    OBJECT,
    ARRAY,
};

[[nodiscard]] auto get_value_type_name(ValueType type) -> const char *;

/*
 * Generic document value: null, boolean, arbitrary-precision number, string, array, or object.
 * Object keys are unique; the last occurrence of a duplicated key wins.
 */
class Value {
public:
    using Array = std::vector<Value>;
    using Object = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : m_data {b} {}
    Value(Decimal n) : m_data {std::move(n)} {}
    Value(std::string s) : m_data {std::move(s)} {}
    Value(const char *s) : m_data {std::string {s}} {}
    Value(Array a) : m_data {std::move(a)} {}
    Value(Object o) : m_data {std::move(o)} {}

    [[nodiscard]] auto type() const -> ValueType;

    [[nodiscard]] auto is_null() const -> bool
    {
        return std::holds_alternative<std::nullptr_t>(m_data);
    }

    [[nodiscard]] auto is_boolean() const -> bool
    {
        return std::holds_alternative<bool>(m_data);
    }

    [[nodiscard]] auto is_number() const -> bool
    {
        return std::holds_alternative<Decimal>(m_data);
    }

    [[nodiscard]] auto is_string() const -> bool
    {
        return std::holds_alternative<std::string>(m_data);
    }

    [[nodiscard]] auto is_array() const -> bool
    {
        return std::holds_alternative<Array>(m_data);
    }

    [[nodiscard]] auto is_object() const -> bool
    {
        return std::holds_alternative<Object>(m_data);
    }

    [[nodiscard]] auto as_boolean() const -> bool;
    [[nodiscard]] auto as_number() const -> const Decimal &;
    [[nodiscard]] auto as_string() const -> const std::string &;
    [[nodiscard]] auto as_array() const -> const Array &;
    [[nodiscard]] auto as_object() const -> const Object &;
    [[nodiscard]] auto as_array() -> Array &;
    [[nodiscard]] auto as_object() -> Object &;

    // Compact document text for this value.
    [[nodiscard]] auto to_string() const -> std::string;

private:
    std::variant<std::nullptr_t, bool, Decimal, std::string, Array, Object> m_data {nullptr};

    friend auto operator==(const Value &lhs, const Value &rhs) -> bool;
};

auto operator==(const Value &lhs, const Value &rhs) -> bool;
auto operator!=(const Value &lhs, const Value &rhs) -> bool;

} // namespace Tessera

#endif // TESSERA_VALUE_H
