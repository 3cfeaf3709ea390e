#ifndef TESSERA_UTILS_LOGGING_H
#define TESSERA_UTILS_LOGGING_H

#include "tessera/slice.h"

namespace Tessera {

auto append_number(std::string &out, Size value) -> void;
auto append_escaped_string(std::string &out, const Slice &value) -> void;
auto number_to_string(Size value) -> std::string;

// Replace unprintable bytes with "\xNN" escapes, for use in log and error messages.
auto escape_string(const Slice &value) -> std::string;

} // namespace Tessera

#endif // TESSERA_UTILS_LOGGING_H
