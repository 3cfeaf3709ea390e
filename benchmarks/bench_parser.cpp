#include "bench.h"
#include <benchmark/benchmark.h>
#include <tessera/tessera.h>
#include <vector>

namespace {

using namespace Tessera;

const auto RESPONSE = make_response(BENCH_ROW_COUNT);

auto open_parser(PullParser &parser, Source &source, Size chunk_size)
{
    Options options;
    options.chunk_size = chunk_size;
    benchmark::DoNotOptimize(parser.open(source, options));
}

// Open the "data" array of the first result set.
auto skip_to_rows(PullParser &parser, ArrayIterator &rows)
{
    Element element;
    benchmark::DoNotOptimize(parser.expect_object());
    benchmark::DoNotOptimize(parser.expect_field("queueDuration", element));
    benchmark::DoNotOptimize(parser.expect_field("queryDuration", element));
    benchmark::DoNotOptimize(parser.expect_field("results", element, ValueType::ARRAY));
    benchmark::DoNotOptimize(parser.expect_array_value(element, ValueType::OBJECT));
    benchmark::DoNotOptimize(parser.expect_field("resultSet", element));
    benchmark::DoNotOptimize(parser.expect_field("columns", element, ValueType::ARRAY, false, true));
    benchmark::DoNotOptimize(parser.expect_field("data", element, ValueType::ARRAY));
    rows = std::get<ArrayIterator>(element);
}

auto BM_NextEvent(benchmark::State &state)
{
    for (auto _ : state) {
        StringSource source {RESPONSE};
        PullParser parser;
        open_parser(parser, source, static_cast<Size>(state.range(0)));

        Event event;
        while (parser.next_event(event).is_ok()) {
            benchmark::DoNotOptimize(event);
        }
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * RESPONSE.size()));
}
BENCHMARK(BM_NextEvent)->Arg(64)->Arg(0x1000)->Arg(DEFAULT_CHUNK_SIZE);

auto BM_ReadRows(benchmark::State &state)
{
    for (auto _ : state) {
        StringSource source {RESPONSE};
        PullParser parser;
        open_parser(parser, source, DEFAULT_CHUNK_SIZE);

        ArrayIterator rows;
        skip_to_rows(parser, rows);
        Value row;
        while (rows.next(row).is_ok()) {
            benchmark::DoNotOptimize(row);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * BENCH_ROW_COUNT));
}
BENCHMARK(BM_ReadRows);

auto BM_ConvertRows(benchmark::State &state)
{
    DefaultDataTypeConverter converter;
    benchmark::DoNotOptimize(converter.open());
    const char *types[] {"INTEGER", "DECIMAL(18,2)", "TIMESTAMP(6)", "VARBYTE", "VARCHAR"};
    std::vector<TypeCode> codes;
    for (const auto *type: types) {
        codes.emplace_back(converter.convert_type("teradata", type));
    }

    for (auto _ : state) {
        state.PauseTiming();
        StringSource source {RESPONSE};
        PullParser parser;
        open_parser(parser, source, DEFAULT_CHUNK_SIZE);
        ArrayIterator rows;
        skip_to_rows(parser, rows);
        state.ResumeTiming();

        Value row;
        while (rows.next(row).is_ok()) {
            const auto &cells = row.as_array();
            for (Size i {}; i < codes.size(); ++i) {
                SqlValue value;
                benchmark::DoNotOptimize(converter.convert_value("teradata", types[i], codes[i], cells[i], value));
                benchmark::DoNotOptimize(value);
            }
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * BENCH_ROW_COUNT));
}
BENCHMARK(BM_ConvertRows);

} // namespace

BENCHMARK_MAIN();
