#include "tessera/period.h"
#include <regex>
#include "tessera/status.h"
#include "utils/logging.h"
#include "utils/utils.h"

namespace Tessera {

template<class T, class Parse>
static auto parse_bounds(const std::smatch &match, Parse &&parse, AnyPeriod &out) -> Status
{
    Period<T> period;
    auto s = parse(match[1].str(), period.start);
    if (s.is_ok()) {
        s = parse(match[2].str(), period.end);
    }
    if (!s.is_ok()) {
        return Status::invalid_period(s.what());
    }
    out = period;
    return Status::ok();
}

auto parse_period(const Slice &type_name, const Slice &text, AnyPeriod &out) -> Status
{
    // Anchored at the start only. Anything after the closing parenthesis is ignored.
    static const std::regex pattern {R"(^\('(.*)',\s*'(.*)'\))"};

    const auto input = text.to_string();
    const auto name = type_name.to_string_view();
    std::smatch match;
    if (!std::regex_search(input, match, pattern)) {
        return Status::invalid_period(escape_string(type_name) + " format invalid: " + escape_string(text));
    }
    if (name.find("TIMESTAMP") != std::string_view::npos) {
        return parse_bounds<Timestamp>(match, [](const auto &s, auto &t) {return parse_timestamp(s, t);}, out);
    } else if (name.find("TIME") != std::string_view::npos) {
        return parse_bounds<Time>(match, [](const auto &s, auto &t) {return parse_time(s, t);}, out);
    } else if (name.find("DATE") != std::string_view::npos) {
        return parse_bounds<Date>(match, [](const auto &s, auto &t) {return parse_date(s, t);}, out);
    }
    return Status::invalid_period("Unknown PERIOD data type: " + escape_string(type_name));
}

} // namespace Tessera
