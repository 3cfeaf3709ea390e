#ifndef TESSERA_BENCHMARKS_H
#define TESSERA_BENCHMARKS_H

#include <string>
#include <tessera/slice.h>

namespace Tessera {

static constexpr Size BENCH_ROW_COUNT {1'000};
static constexpr auto BENCH_COLUMNS =
    R"j([{"name": "id", "type": "INTEGER"}, {"name": "price", "type": "DECIMAL(18,2)"},)j"
    R"j( {"name": "created", "type": "TIMESTAMP(6)"}, {"name": "tag", "type": "VARBYTE"},)j"
    R"j( {"name": "note", "type": "VARCHAR"}])j";

// Build a response document holding a single result set with "rows" rows.
inline auto make_response(Size rows) -> std::string
{
    std::string out {R"({"queueDuration": 1, "queryDuration": 2, "results": [{"resultSet": true, "columns": )"};
    out.append(BENCH_COLUMNS);
    out.append(R"(, "data": [)");
    for (Size i {}; i < rows; ++i) {
        if (i) {
            out.push_back(',');
        }
        const auto n = std::to_string(i);
        out.append("\n[" + n + ", \"" + n + ".25\", \"2023-07-04 12:34:56.123456\", \"cafe" + std::to_string(i % 10) +
                   "0\", \"row \\\"" + n + "\\\" [x]\"]");
    }
    out.append("]}]}");
    return out;
}

} // namespace Tessera

#endif // TESSERA_BENCHMARKS_H
