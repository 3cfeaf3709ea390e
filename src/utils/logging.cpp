#include "logging.h"
#include <iterator>
#include <spdlog/fmt/fmt.h>

namespace Tessera {

auto append_number(std::string &out, Size value) -> void
{
    fmt::format_to(std::back_inserter(out), "{}", value);
}

auto append_escaped_string(std::string &out, const Slice &value) -> void
{
    for (const auto c: value.to_string_view()) {
        if (c >= ' ' && c <= '~') {
            out.push_back(c);
        } else {
            fmt::format_to(std::back_inserter(out), "\\x{:02x}", static_cast<unsigned>(static_cast<unsigned char>(c)));
        }
    }
}

auto number_to_string(Size value) -> std::string
{
    return fmt::format("{}", value);
}

auto escape_string(const Slice &value) -> std::string
{
    std::string out;
    out.reserve(value.size());
    append_escaped_string(out, value);
    return out;
}

} // namespace Tessera
