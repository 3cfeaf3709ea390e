#ifndef TESSERA_COMMON_H
#define TESSERA_COMMON_H

#include <cstdint>

namespace Tessera {

// Common types.
using Byte = char;
using Size = std::uint64_t;

} // namespace Tessera

#endif // TESSERA_COMMON_H
