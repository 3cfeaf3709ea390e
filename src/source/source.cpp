#include "tessera/source.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include "tessera/status.h"
#include "utils/utils.h"

namespace Tessera {

[[nodiscard]]
static auto to_status(int code, const std::string &path) -> Status
{
    const auto message = path + ": " + std::strerror(code);
    switch (code) {
        case ENOENT:
            return Status::not_found(message);
        case EINVAL:
            return Status::invalid_argument(message);
        default:
            return Status::system_error(message);
    }
}

[[nodiscard]]
static auto errno_to_status(const std::string &path) -> Status
{
    const auto code = errno;
    errno = 0;
    return to_status(code, path);
}

StringSource::StringSource(std::string data)
    : m_data {std::move(data)}
{}

auto StringSource::read(Byte *out, Size &size) -> Status
{
    TESSERA_EXPECT_LE(m_offset, m_data.size());
    size = std::min<Size>(size, m_data.size() - m_offset);
    std::memcpy(out, m_data.data() + m_offset, size);
    m_offset += size;
    return Status::ok();
}

FileSource::FileSource(std::string path, int file)
    : m_path {std::move(path)},
      m_file {file}
{
    TESSERA_EXPECT_GE(m_file, 0);
}

FileSource::~FileSource()
{
    // Nothing was written through this descriptor, so a failure to close it loses no data.
    if (close(m_file)) {
        errno = 0;
    }
}

auto FileSource::open(const std::string &path, FileSource **out) -> Status
{
    int file;
    do {
        file = ::open(path.c_str(), O_RDONLY);
    } while (file < 0 && errno == EINTR);

    if (file < 0) {
        return errno_to_status(path);
    }
    *out = new FileSource {path, file};
    return Status::ok();
}

auto FileSource::read(Byte *out, Size &size) -> Status
{
    // Fill the buffer unless the end of the file is reached first.
    Size total {};
    while (total < size) {
        const auto n = ::read(m_file, out + total, size - total);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno_to_status(m_path);
        } else if (n == 0) {
            break;
        }
        total += static_cast<Size>(n);
    }
    size = total;
    return Status::ok();
}

} // namespace Tessera
