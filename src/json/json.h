#ifndef TESSERA_JSON_JSON_H
#define TESSERA_JSON_JSON_H

#include "tessera/slice.h"
#include "tessera/status.h"
#include "tessera/value.h"

namespace Tessera::Json {

/*
 * Receives the parts of a document from a Reader, in document order. Returning false from any method stops
 * the reader.
 */
class Handler {
public:
    virtual ~Handler() = default;

    [[nodiscard]] virtual auto accept_key(const Slice &value) -> bool = 0;
    [[nodiscard]] virtual auto accept_string(const Slice &value) -> bool = 0;

    // Numbers are passed as they appear in the input, after validation against the RFC 8259 grammar.
    [[nodiscard]] virtual auto accept_number(const Slice &text) -> bool = 0;
    [[nodiscard]] virtual auto accept_boolean(bool value) -> bool = 0;
    [[nodiscard]] virtual auto accept_null() -> bool = 0;
    [[nodiscard]] virtual auto begin_object() -> bool = 0;
    [[nodiscard]] virtual auto end_object() -> bool = 0;
    [[nodiscard]] virtual auto begin_array() -> bool = 0;
    [[nodiscard]] virtual auto end_array() -> bool = 0;
};

// Reads a complete document held in memory. Errors are reported as corruption statuses that carry the line and column.
class Reader {
public:
    explicit Reader(Handler &h)
        : m_handler {&h}
    {}

    [[nodiscard]] auto read(const Slice &input) -> Status;

    Reader(const Reader &) = delete;
    auto operator=(const Reader &) -> Reader & = delete;

private:
    Handler *m_handler;
};

// Decode a complete document into a value tree. Escapes in strings are interpreted and numbers become Decimals.
[[nodiscard]] auto decode(const Slice &input, Value &out) -> Status;

} // namespace Tessera::Json

#endif // TESSERA_JSON_JSON_H
