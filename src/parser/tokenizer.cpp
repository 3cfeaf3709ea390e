#include "tokenizer.h"
#include "utils/utils.h"

namespace Tessera {

auto Tokenizer::reset(const Slice &chunk) -> void
{
    // A half token never contains a delimiter, so prefixing it onto the text is the same as prefixing it
    // onto the first token.
    m_text = std::move(m_half);
    m_text.append(chunk.data(), chunk.size());
    m_half.clear();
    m_tokens.clear();
    m_index = 0;

    const Slice text {m_text};
    Size start {};
    for (Size i {}; i < text.size(); ++i) {
        if (is_delimiter(text[i])) {
            m_tokens.emplace_back(text.range(start, i - start));
            m_tokens.emplace_back(text.range(i, 1));
            start = i + 1;
        }
    }
    m_tokens.emplace_back(text.range(start));
}

auto Tokenizer::next() -> Slice
{
    TESSERA_EXPECT_TRUE(has_next());
    return m_tokens[m_index++];
}

auto Tokenizer::unget() -> void
{
    TESSERA_EXPECT_GT(m_index, 0);
    --m_index;
}

} // namespace Tessera
