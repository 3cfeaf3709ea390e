#include "chunk_reader.h"
#include "tessera/options.h"
#include "utils/utils.h"

namespace Tessera {

ChunkReader::ChunkReader(Source &source, Size chunk_size)
    : m_buffer(chunk_size, '\0'),
      m_source {&source}
{
    TESSERA_EXPECT_GE(chunk_size, MINIMUM_CHUNK_SIZE);
}

auto ChunkReader::read() -> Result<Slice>
{
    auto size = m_buffer.size();
    if (auto s = m_source->read(m_buffer.data(), size); !s.is_ok()) {
        return Err {s};
    }
    TESSERA_EXPECT_LE(size, m_buffer.size());
    m_bytes_read += size;
    return Slice {m_buffer}.range(0, size);
}

} // namespace Tessera
