#ifndef TESSERA_PARSER_H
#define TESSERA_PARSER_H

#include <memory>
#include <optional>
#include <variant>
#include "options.h"
#include "value.h"

namespace Tessera {

class Parser;
class Source;
class Status;

enum class EventType {
    START_OBJECT,
    START_ARRAY,
    FIELD_NAME,
    FIELD_VALUE,
    ARRAY_VALUE,
    END_OBJECT,
    END_ARRAY,
};

[[nodiscard]] auto get_event_type_name(EventType type) -> const char *;

struct Event {
    EventType type {};

    // Field name for FIELD_NAME, scalar value for FIELD_VALUE and ARRAY_VALUE.
    Value value;
    std::optional<ValueType> value_type;

    // Position of this element in the enclosing array, if there is one.
    std::optional<Size> array_index;

    // Number of elements, only set on END_ARRAY.
    std::optional<Size> array_length;

    // True if the element this event belongs to is a member of an array.
    bool in_array {};

    [[nodiscard]] auto to_string() const -> std::string;
};

/*
 * Single-pass sequence of the elements of an array. Scalars are produced as they are, nested objects and
 * arrays are materialized. Advancing the iterator advances the parser it was created from.
 */
class ArrayIterator final {
public:
    ArrayIterator() = default;

    /*
     * Produce the next element. Returns a not_found status once the end of the array has been consumed,
     * and on every call after that.
     */
    [[nodiscard]] auto next(Value &out) -> Status;

    [[nodiscard]] auto is_done() const -> bool
    {
        return m_done;
    }

private:
    friend class Parser;

    explicit ArrayIterator(Parser &parser)
        : m_parser {&parser}
    {}

    Parser *m_parser {};
    bool m_done {};
};

// Result of a value expectation: either a value or an iterator over an array that was left open.
using Element = std::variant<Value, ArrayIterator>;

/*
 * Incremental document parser. Input is pulled from a Source in chunks of Options::chunk_size bytes, and
 * the document is reported one structural event at a time. The events produced do not depend on how the
 * input is divided into chunks.
 *
 * Escape sequences in strings reported through events are not interpreted: the token following a backslash
 * is copied as it is ("\n" becomes "n"). Subtrees produced by read_object() and read_array() are decoded
 * with conventional escape handling.
 *
 * After any non-OK status (other than the not_found status signaling the end of the input), the parser must
 * be discarded.
 */
class PullParser final {
public:
    PullParser();
    ~PullParser();

    /*
     * Attach the parser to a source. The source must outlive the parser. Returns an invalid_argument status if
     * the chunk size is out of range.
     */
    [[nodiscard]] auto open(Source &source, const Options &options = {}) -> Status;

    /*
     * Produce the next event. Returns a not_found status when the input is exhausted between documents,
     * and an incomplete_document status if it ends in the middle of one.
     */
    [[nodiscard]] auto next_event(Event &out) -> Status;

    // Consume a START_OBJECT event.
    [[nodiscard]] auto expect_object() -> Status;

    // Consume a START_ARRAY event and produce an iterator over its elements.
    [[nodiscard]] auto expect_array(ArrayIterator &out) -> Status;

    /*
     * Consume the field named "name" and produce its value. If "type" is given, the value must be of that
     * type, unless "allow_null" is set and the value is null. An array value is produced as an iterator when
     * "type" is ARRAY and "read_all" is not set, and is materialized otherwise. An object value is
     * materialized unless "type" is OBJECT and "read_all" is not set, in which case the object is left open
     * and a null value is produced.
     */
    [[nodiscard]] auto expect_field(const Slice &name, Element &out, std::optional<ValueType> type = std::nullopt,
                                    bool allow_null = false, bool read_all = false) -> Status;

    // Like expect_field(), but for the next element of the enclosing array.
    [[nodiscard]] auto expect_array_value(Element &out, std::optional<ValueType> type = std::nullopt,
                                          bool allow_null = false, bool read_all = false) -> Status;

    // Read the next object or array in its entirety.
    [[nodiscard]] auto read_object(Value &out) -> Status;
    [[nodiscard]] auto read_array(Value &out) -> Status;

    // Read the rest of the object or array that "start" opened.
    [[nodiscard]] auto read_object(const Event &start, Value &out) -> Status;
    [[nodiscard]] auto read_array(const Event &start, Value &out) -> Status;

    PullParser(const PullParser &) = delete;
    auto operator=(const PullParser &) -> PullParser & = delete;
    PullParser(PullParser &&) noexcept;
    auto operator=(PullParser &&) noexcept -> PullParser &;

private:
    std::unique_ptr<Parser> m_parser;
};

} // namespace Tessera

#endif // TESSERA_PARSER_H
