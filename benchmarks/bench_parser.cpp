// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  sqlparse - Parser Benchmarks                                                ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include <benchmark/benchmark.h>

#include "sqlparse/sqlparse.hpp"
#include "internal/sql/normalizer.hpp"
#include "internal/sql/scanner.hpp"

#include <string>
#include <vector>

using namespace sqlparse;

namespace {

const char* kSelect = "SELECT a, b, c FROM db.t WHERE a = 1 AND b != 'x' ORDER BY a DESC, b";
const char* kJoin =
    "SELECT a.id, b.name FROM a JOIN b ON a.id = b.a_id "
    "LEFT JOIN c ON b.id = c.b_id AND b.x >= c.y WHERE a.id > 1 ORDER BY a.id DESC";

std::string make_insert(int rows) {
    std::string sql = "INSERT INTO t (a, b, c) VALUES ";
    for (int i = 0; i < rows; ++i) {
        if (i > 0) sql += ", ";
        sql += "(" + std::to_string(i) + ", 'name " + std::to_string(i) + "', x)";
    }
    return sql;
}

} // anonymous namespace

static void BM_ScanToken(benchmark::State& state) {
    std::string_view sql = kSelect;
    for (auto _ : state) {
        std::size_t pos = 0;
        while (pos < sql.size()) {
            auto token = sql::scan_token(sql, pos);
            if (token.empty()) break;
            pos = sql::skip_spaces(sql, pos + token.length);
        }
        benchmark::DoNotOptimize(pos);
    }
}
BENCHMARK(BM_ScanToken);

static void BM_Normalize(benchmark::State& state) {
    std::string sql = "  SELECT\t`a`,\n   `b`   FROM  `t`\n WHERE   a = 1  ";
    for (auto _ : state) {
        auto out = sql::normalize(sql);
        benchmark::DoNotOptimize(out);
    }
}
BENCHMARK(BM_Normalize);

static void BM_ParseSelect(benchmark::State& state) {
    for (auto _ : state) {
        auto result = parse(kSelect);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ParseSelect);

static void BM_ParseJoin(benchmark::State& state) {
    for (auto _ : state) {
        auto result = parse(kJoin);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_ParseJoin);

static void BM_ParseInsertRows(benchmark::State& state) {
    std::string sql = make_insert(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto result = parse(sql);
        benchmark::DoNotOptimize(result);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(sql.size()));
}
BENCHMARK(BM_ParseInsertRows)->Range(1, 1024);

static void BM_ParseMany(benchmark::State& state) {
    std::vector<std::string> sqls(static_cast<std::size_t>(state.range(0)), kSelect);
    for (auto _ : state) {
        auto batch = parse_many(sqls);
        benchmark::DoNotOptimize(batch);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ParseMany)->Range(8, 512);

static void BM_RenderQuery(benchmark::State& state) {
    auto query = parse(kJoin).value();
    for (auto _ : state) {
        auto text = query.to_string();
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(BM_RenderQuery);

BENCHMARK_MAIN();
