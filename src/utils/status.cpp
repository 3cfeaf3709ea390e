#include "tessera/status.h"
#include <cstring>
#include "utils.h"

namespace Tessera {

static auto maybe_copy_data(const Byte *data) -> std::unique_ptr<Byte[]>
{
    // Status is OK, so there isn't anything to copy.
    if (data == nullptr) {
        return nullptr;
    }
    // Allocate memory for the copied message and status code. The code byte is never zero, so the length
    // computation stops at the message terminator.
    const auto total_size = std::char_traits<Byte>::length(data) + sizeof(Byte);
    auto copy = std::make_unique<Byte[]>(total_size);

    // std::make_unique<Byte[]>() will zero initialize, so we already have the null byte.
    std::memcpy(copy.get(), data, total_size - sizeof(Byte));
    return copy;
}

Status::Status(Code code, const Slice &what)
    : m_data {std::make_unique<Byte[]>(what.size() + 2 * sizeof(Byte))}
{
    TESSERA_EXPECT_NE(code, Code::OK);
    auto *ptr = m_data.get();

    // The first byte holds the status code.
    *ptr++ = static_cast<Byte>(code);

    // The rest holds the message, plus a '\0'.
    std::memcpy(ptr, what.data(), what.size());
}

Status::Status(const Status &rhs)
    : m_data {maybe_copy_data(rhs.m_data.get())}
{}

Status::Status(Status &&rhs) noexcept
    : m_data {std::move(rhs.m_data)}
{}

auto Status::operator=(const Status &rhs) -> Status &
{
    if (this != &rhs) {
        m_data = maybe_copy_data(rhs.m_data.get());
    }
    return *this;
}

auto Status::operator=(Status &&rhs) noexcept -> Status &
{
    if (this != &rhs) {
        m_data = std::move(rhs.m_data);
    }
    return *this;
}

auto Status::ok() -> Status
{
    return Status {};
}

auto Status::invalid_argument(const Slice &what) -> Status
{
    return Status {Code::INVALID_ARGUMENT, what};
}

auto Status::system_error(const Slice &what) -> Status
{
    return Status {Code::SYSTEM_ERROR, what};
}

auto Status::logic_error(const Slice &what) -> Status
{
    return Status {Code::LOGIC_ERROR, what};
}

auto Status::corruption(const Slice &what) -> Status
{
    return Status {Code::CORRUPTION, what};
}

auto Status::not_found(const Slice &what) -> Status
{
    return Status {Code::NOT_FOUND, what};
}

auto Status::not_supported(const Slice &what) -> Status
{
    return Status {Code::NOT_SUPPORTED, what};
}

auto Status::syntax_error(const Slice &what) -> Status
{
    return Status {Code::SYNTAX_ERROR, what};
}

auto Status::incomplete_document(const Slice &what) -> Status
{
    return Status {Code::INCOMPLETE_DOCUMENT, what};
}

auto Status::unexpected_element(const Slice &what) -> Status
{
    return Status {Code::UNEXPECTED_ELEMENT, what};
}

auto Status::invalid_date(const Slice &what) -> Status
{
    return Status {Code::INVALID_DATE, what};
}

auto Status::invalid_time(const Slice &what) -> Status
{
    return Status {Code::INVALID_TIME, what};
}

auto Status::invalid_timestamp(const Slice &what) -> Status
{
    return Status {Code::INVALID_TIMESTAMP, what};
}

auto Status::invalid_interval(const Slice &what) -> Status
{
    return Status {Code::INVALID_INTERVAL, what};
}

auto Status::invalid_period(const Slice &what) -> Status
{
    return Status {Code::INVALID_PERIOD, what};
}

auto Status::code() const -> Code
{
    return m_data ? Code {m_data[0]} : Code::OK;
}

auto Status::what() const -> Slice
{
    return m_data ? Slice {m_data.get() + sizeof(Byte)} : Slice {};
}

auto Status::is_ok() const -> bool
{
    return m_data == nullptr;
}

auto Status::is_invalid_argument() const -> bool
{
    return code() == Code::INVALID_ARGUMENT;
}

auto Status::is_system_error() const -> bool
{
    return code() == Code::SYSTEM_ERROR;
}

auto Status::is_logic_error() const -> bool
{
    return code() == Code::LOGIC_ERROR;
}

auto Status::is_corruption() const -> bool
{
    return code() == Code::CORRUPTION;
}

auto Status::is_not_found() const -> bool
{
    return code() == Code::NOT_FOUND;
}

auto Status::is_not_supported() const -> bool
{
    return code() == Code::NOT_SUPPORTED;
}

auto Status::is_syntax_error() const -> bool
{
    return code() == Code::SYNTAX_ERROR;
}

auto Status::is_incomplete_document() const -> bool
{
    return code() == Code::INCOMPLETE_DOCUMENT;
}

auto Status::is_unexpected_element() const -> bool
{
    return code() == Code::UNEXPECTED_ELEMENT;
}

auto Status::is_invalid_date() const -> bool
{
    return code() == Code::INVALID_DATE;
}

auto Status::is_invalid_time() const -> bool
{
    return code() == Code::INVALID_TIME;
}

auto Status::is_invalid_timestamp() const -> bool
{
    return code() == Code::INVALID_TIMESTAMP;
}

auto Status::is_invalid_interval() const -> bool
{
    return code() == Code::INVALID_INTERVAL;
}

auto Status::is_invalid_period() const -> bool
{
    return code() == Code::INVALID_PERIOD;
}

} // namespace Tessera
