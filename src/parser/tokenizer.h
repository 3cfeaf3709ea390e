#ifndef TESSERA_PARSER_TOKENIZER_H
#define TESSERA_PARSER_TOKENIZER_H

#include <string>
#include <vector>
#include "tessera/slice.h"

namespace Tessera {

[[nodiscard]]
inline auto is_delimiter(Byte c) -> bool
{
    switch (c) {
        case '{':
        case '}':
        case '[':
        case ']':
        case ':':
        case ',':
        case '"':
        case '\\':
            return true;
        default:
            return false;
    }
}

/*
 * Splits chunks of input into tokens. Each delimiter ({ } [ ] : , " \) is a token by itself, and each run of
 * characters between two delimiters is another token, which may be empty. A token that was cut off at the end
 * of a chunk can be held back as the "half token", in which case it is prefixed onto the first token of the
 * next chunk.
 */
class Tokenizer final {
public:
    // Replace the current tokens with the tokens in "chunk". Slices returned earlier become invalid.
    auto reset(const Slice &chunk) -> void;

    [[nodiscard]] auto has_next() const -> bool
    {
        return m_index < m_tokens.size();
    }

    auto next() -> Slice;

    // Step back so that the most recent token is returned again.
    auto unget() -> void;

    auto set_half_token(const Slice &token) -> void
    {
        m_half = token.to_string();
    }

    [[nodiscard]] auto has_half_token() const -> bool
    {
        return !m_half.empty();
    }

private:
    std::vector<Slice> m_tokens;
    std::string m_text;
    std::string m_half;
    Size m_index {};
};

} // namespace Tessera

#endif // TESSERA_PARSER_TOKENIZER_H
