#ifndef TESSERA_PARSER_CHUNK_READER_H
#define TESSERA_PARSER_CHUNK_READER_H

#include <string>
#include "tessera/source.h"
#include "utils/result.h"

namespace Tessera {

// Pulls fixed-size chunks of input from a source on demand.
class ChunkReader final {
public:
    ChunkReader(Source &source, Size chunk_size);

    /*
     * Read the next chunk. The returned slice refers to an internal buffer, which is overwritten by the next
     * call. An empty slice indicates the end of the input.
     */
    [[nodiscard]] auto read() -> Result<Slice>;

    [[nodiscard]] auto bytes_read() const -> Size
    {
        return m_bytes_read;
    }

private:
    std::string m_buffer;
    Source *m_source {};
    Size m_bytes_read {};
};

} // namespace Tessera

#endif // TESSERA_PARSER_CHUNK_READER_H
