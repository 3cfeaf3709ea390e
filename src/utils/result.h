#ifndef TESSERA_UTILS_RESULT_H
#define TESSERA_UTILS_RESULT_H

#include <tl/expected.hpp>
#include "tessera/status.h"

#define TESSERA_TRY_R(expr) \
    do { \
        if (auto tessera_try_result = (expr); !tessera_try_result.has_value()) \
            return tl::make_unexpected(tessera_try_result.error()); \
    } while (0)

#define TESSERA_NEW_R(out, expr) \
    auto tessera_try_##out = (expr); \
    if (!tessera_try_##out.has_value()) { \
        return tl::make_unexpected(tessera_try_##out.error()); \
    } \
    auto out = std::move(*tessera_try_##out)

namespace Tessera {

template<class T>
using Result = tl::expected<T, Status>;
using Err = tl::unexpected<Status>;

} // namespace Tessera

#endif // TESSERA_UTILS_RESULT_H
