#ifndef TESSERA_PARSER_PARSER_H
#define TESSERA_PARSER_PARSER_H

#include <optional>
#include <vector>
#include "chunk_reader.h"
#include "frame.h"
#include "tessera/parser.h"
#include "tokenizer.h"
#include "utils/system.h"

namespace Tessera {

class Parser final {
public:
    struct Parameters {
        Source *source {};
        Size chunk_size {};
        LogPtr log;
    };

    explicit Parser(const Parameters &param);

    [[nodiscard]] auto next_event(Event &out) -> Status;
    [[nodiscard]] auto expect_object() -> Status;
    [[nodiscard]] auto expect_array(ArrayIterator &out) -> Status;
    [[nodiscard]] auto expect_field(const Slice &name, Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status;
    [[nodiscard]] auto expect_array_value(Element &out, std::optional<ValueType> type, bool allow_null, bool read_all) -> Status;
    [[nodiscard]] auto read_object(Value &out) -> Status;
    [[nodiscard]] auto read_array(Value &out) -> Status;
    [[nodiscard]] auto read_object(const Event &start, Value &out) -> Status;
    [[nodiscard]] auto read_array(const Event &start, Value &out) -> Status;

    // Produce the next element of the innermost open array. Returns not_found after consuming the END_ARRAY event.
    [[nodiscard]] auto next_element(Value &out) -> Status;

private:
    [[nodiscard]] auto fill(bool &eof) -> Status;
    [[nodiscard]] auto require_event(Event &out, const char *what) -> Status;
    [[nodiscard]] auto expect_value(EventType type, std::optional<ValueType> value_type, bool allow_null, bool read_all, Element &out) -> Status;
    [[nodiscard]] auto push(FrameType type, std::string name, Event &out) -> Status;
    [[nodiscard]] auto pop(std::optional<Event> &out) -> Status;
    [[nodiscard]] auto finish_array_value(std::optional<Event> &out) -> Status;
    [[nodiscard]] auto scan_string() -> Status;
    [[nodiscard]] auto scan_scalar(const Slice &token) -> Status;
    [[nodiscard]] auto check_value_position(const Slice &token) const -> Status;
    [[nodiscard]] auto materialize(const Event &start, Value &out) -> Status;
    auto clear_value() -> void;

    ChunkReader m_reader;
    Tokenizer m_tokenizer;
    std::vector<Frame> m_frames;
    Value m_value;
    std::optional<ValueType> m_value_type;
    LogPtr m_log;
};

} // namespace Tessera

#endif // TESSERA_PARSER_PARSER_H
