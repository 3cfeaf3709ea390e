#ifndef TESSERA_STATUS_H
#define TESSERA_STATUS_H

#include <memory>
#include "slice.h"

namespace Tessera {

class Status final {
public:
    enum class Code : Byte {
        OK = 0,
        INVALID_ARGUMENT = 1,
        SYSTEM_ERROR = 2,
        LOGIC_ERROR = 3,
        CORRUPTION = 4,
        NOT_FOUND = 5,
        NOT_SUPPORTED = 6,

        // Document parser errors.
        SYNTAX_ERROR = 7,
        INCOMPLETE_DOCUMENT = 8,
        UNEXPECTED_ELEMENT = 9,

        // Literal codec errors.
        INVALID_DATE = 10,
        INVALID_TIME = 11,
        INVALID_TIMESTAMP = 12,
        INVALID_INTERVAL = 13,
        INVALID_PERIOD = 14,
    };

    /*
     * Create an OK status.
     */
    [[nodiscard]] static auto ok() -> Status;

    /*
     * Create a non-OK status with an error message.
     */
    [[nodiscard]] static auto invalid_argument(const Slice &what) -> Status;
    [[nodiscard]] static auto system_error(const Slice &what) -> Status;
    [[nodiscard]] static auto logic_error(const Slice &what) -> Status;
    [[nodiscard]] static auto corruption(const Slice &what) -> Status;
    [[nodiscard]] static auto not_found(const Slice &what) -> Status;
    [[nodiscard]] static auto not_supported(const Slice &what) -> Status;
    [[nodiscard]] static auto syntax_error(const Slice &what) -> Status;
    [[nodiscard]] static auto incomplete_document(const Slice &what) -> Status;
    [[nodiscard]] static auto unexpected_element(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_date(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_time(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_timestamp(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_interval(const Slice &what) -> Status;
    [[nodiscard]] static auto invalid_period(const Slice &what) -> Status;

    /*
     * Check status type.
     */
    [[nodiscard]] auto is_ok() const -> bool;
    [[nodiscard]] auto is_invalid_argument() const -> bool;
    [[nodiscard]] auto is_system_error() const -> bool;
    [[nodiscard]] auto is_logic_error() const -> bool;
    [[nodiscard]] auto is_corruption() const -> bool;
    [[nodiscard]] auto is_not_found() const -> bool;
    [[nodiscard]] auto is_not_supported() const -> bool;
    [[nodiscard]] auto is_syntax_error() const -> bool;
    [[nodiscard]] auto is_incomplete_document() const -> bool;
    [[nodiscard]] auto is_unexpected_element() const -> bool;
    [[nodiscard]] auto is_invalid_date() const -> bool;
    [[nodiscard]] auto is_invalid_time() const -> bool;
    [[nodiscard]] auto is_invalid_timestamp() const -> bool;
    [[nodiscard]] auto is_invalid_interval() const -> bool;
    [[nodiscard]] auto is_invalid_period() const -> bool;

    /*
     * Get the status code. Code::OK is returned for an OK status.
     */
    [[nodiscard]] auto code() const -> Code;

    /*
     * Get the error message, if it exists.
     */
    [[nodiscard]] auto what() const -> Slice;

    // Status can be copied and moved.
    Status(const Status &rhs);
    auto operator=(const Status &rhs) -> Status &;
    Status(Status &&rhs) noexcept;
    auto operator=(Status &&rhs) noexcept -> Status &;

private:
    // Construct an OK status. No allocation is needed.
    Status() = default;

    // Construct a non-OK status.
    Status(Code code, const Slice &what);

    // Storage for a status code and a message.
    std::unique_ptr<Byte[]> m_data;
};

// Status object should be the size of a pointer.
static_assert(sizeof(Status) == sizeof(void *));

} // namespace Tessera

#endif // TESSERA_STATUS_H
