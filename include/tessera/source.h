#ifndef TESSERA_SOURCE_H
#define TESSERA_SOURCE_H

#include <string>
#include "slice.h"

namespace Tessera {

class Status;

class Source {
public:
    virtual ~Source() = default;

    /*
     * Read up to "size" bytes into "out". On return, "size" holds the number of bytes produced. A
     * size of 0 indicates that the end of the stream has been reached.
     */
    [[nodiscard]] virtual auto read(Byte *out, Size &size) -> Status = 0;
};

class StringSource : public Source {
public:
    explicit StringSource(std::string data);
    ~StringSource() override = default;
    [[nodiscard]] auto read(Byte *out, Size &size) -> Status override;

private:
    std::string m_data;
    Size m_offset {};
};

class FileSource : public Source {
public:
    [[nodiscard]] static auto open(const std::string &path, FileSource **out) -> Status;

    ~FileSource() override;
    [[nodiscard]] auto read(Byte *out, Size &size) -> Status override;

    FileSource(const FileSource &) = delete;
    auto operator=(const FileSource &) -> FileSource & = delete;

private:
    explicit FileSource(std::string path, int file);

    std::string m_path;
    int m_file {-1};
};

} // namespace Tessera

#endif // TESSERA_SOURCE_H
