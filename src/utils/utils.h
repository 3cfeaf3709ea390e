#ifndef TESSERA_UTILS_H
#define TESSERA_UTILS_H

#include <cstdio>
#include <cstdlib>
#include <string>
#include "tessera/status.h"

#if NDEBUG
#  define TESSERA_EXPECT_(expr, file, line)
#else
#  define TESSERA_EXPECT_(expr, file, line) Impl::expect(expr, #expr, file, line)
#endif // NDEBUG

#define TESSERA_EXPECT_TRUE(expr) TESSERA_EXPECT_(expr, __FILE__, __LINE__)
#define TESSERA_EXPECT_FALSE(expr) TESSERA_EXPECT_TRUE(!(expr))
#define TESSERA_EXPECT_EQ(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) == (rhs))
#define TESSERA_EXPECT_NE(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) != (rhs))
#define TESSERA_EXPECT_LT(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) < (rhs))
#define TESSERA_EXPECT_LE(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) <= (rhs))
#define TESSERA_EXPECT_GT(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) > (rhs))
#define TESSERA_EXPECT_GE(lhs, rhs) TESSERA_EXPECT_TRUE((lhs) >= (rhs))

#define Tessera_Try(expr) \
    do { \
        if (auto __tessera_try_s = (expr); !__tessera_try_s.is_ok()) { \
            return __tessera_try_s; \
        } \
    } while (0)

namespace Tessera {

namespace Impl {

    inline constexpr auto expect(bool cond, const char *repr, const char *file, int line) noexcept -> void
    {
        if (!cond) {
            std::fprintf(stderr, "expectation (%s) failed at %s:%d\n", repr, file, line);
            std::abort();
        }
    }

} // namespace Impl

[[nodiscard]]
inline auto get_status_name(const Status &s) noexcept -> const char *
{
    switch (s.code()) {
        case Status::Code::OK:
            return "OK";
        case Status::Code::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case Status::Code::SYSTEM_ERROR:
            return "SYSTEM_ERROR";
        case Status::Code::LOGIC_ERROR:
            return "LOGIC_ERROR";
        case Status::Code::CORRUPTION:
            return "CORRUPTION";
        case Status::Code::NOT_FOUND:
            return "NOT_FOUND";
        case Status::Code::NOT_SUPPORTED:
            return "NOT_SUPPORTED";
        case Status::Code::SYNTAX_ERROR:
            return "SYNTAX_ERROR";
        case Status::Code::INCOMPLETE_DOCUMENT:
            return "INCOMPLETE_DOCUMENT_ERROR";
        case Status::Code::UNEXPECTED_ELEMENT:
            return "UNEXPECTED_ELEMENT_ERROR";
        case Status::Code::INVALID_DATE:
            return "INVALID_DATE";
        case Status::Code::INVALID_TIME:
            return "INVALID_TIME";
        case Status::Code::INVALID_TIMESTAMP:
            return "INVALID_TIMESTAMP";
        case Status::Code::INVALID_INTERVAL:
            return "INVALID_INTERVAL";
        case Status::Code::INVALID_PERIOD:
            return "INVALID_PERIOD";
    }
    return "UNKNOWN";
}

inline auto is_space(Byte c) -> bool
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline auto is_digit(Byte c) -> bool
{
    return c >= '0' && c <= '9';
}

// Remove leading and trailing whitespace.
inline auto strip(Slice text) -> Slice
{
    while (!text.is_empty() && is_space(text[0])) {
        text.advance();
    }
    while (!text.is_empty() && is_space(text[text.size() - 1])) {
        text.truncate(text.size() - 1);
    }
    return text;
}

} // namespace Tessera

#endif // TESSERA_UTILS_H
