#ifndef TESSERA_PARSER_FRAME_H
#define TESSERA_PARSER_FRAME_H

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include "tessera/value.h"

namespace Tessera {

enum class FrameType {
    OBJECT,
    ARRAY,
    FIELD,
};

static constexpr Size NO_PARENT {std::numeric_limits<Size>::max()};

// Open object, array, or object field. Frames are kept on a stack owned by the parser.
struct Frame {
    FrameType type {};
    Size parent {NO_PARENT};

    // Field name, only used by FIELD frames.
    std::string name;

    // Value of a FIELD frame. Only set for scalars: value_type is OBJECT or ARRAY for other fields.
    Value value;
    std::optional<ValueType> value_type;

    // Position of this frame in its parent, if the parent is an array.
    std::optional<Size> array_index;

    // Number of elements completed so far, and the index of the most recent element. These are equal
    // while an element that has not been followed by a comma is open or was just closed.
    Size array_length {};
    std::int64_t last_index {-1};

    [[nodiscard]] auto is_element_open() const -> bool
    {
        return last_index == static_cast<std::int64_t>(array_length);
    }
};

} // namespace Tessera

#endif // TESSERA_PARSER_FRAME_H
