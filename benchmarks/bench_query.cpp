// Query benchmarks: predicate compilation, windowed scans and batch lookups

#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "query/predicate_compiler.h"
#include "query/query_errors.h"
#include "query/query_executor.h"
#include "schema/schema_registry.h"
#include "storage/rocksdb_store.h"
#include "storage/rocksdb_wrapper.h"

using quarry::Key;
using quarry::Record;
using quarry::RocksDBStore;
using quarry::RocksDBWrapper;
using namespace quarry::query;

namespace {

const char* kBenchSchema = R"(
classes:
  - type: User
    kind: bench_user
    members:
      - { name: id, type: key, primary_key: true }
      - { name: tenant, type: key, parent_key: true }
      - { name: name, type: string }
      - { name: age, type: integer }
)";

NodePtr member(const std::string& name) {
    return makeIdentifier({"this", name});
}

QueryCompilation selectUsers(NodePtr filter) {
    QueryCompilation c;
    c.queryText = "SELECT FROM User";
    c.candidateType = "User";
    c.from.push_back(FromClause{"User", "this", {}});
    c.filter = std::move(filter);
    return c;
}

struct BenchEnv {
    std::unique_ptr<RocksDBWrapper> storage;
    std::unique_ptr<RocksDBStore> store;
    quarry::schema::SchemaRegistry registry;
    bool ready = false;

    static BenchEnv& instance() {
        static BenchEnv env; return env;
    }

    static Key userKey(size_t i) {
        return Key::fromName("tenant", i % 2 == 0 ? "even" : "odd").child("bench_user", static_cast<int64_t>(i));
    }

    void initOnce(size_t N = 100000) {
        if (ready) return;
        const std::string db_path = "data/quarry_bench_query";
        if (std::filesystem::exists(db_path)) {
            std::filesystem::remove_all(db_path);
        }
        RocksDBWrapper::Config cfg; cfg.db_path = db_path; cfg.memtable_size_mb = 128; cfg.block_cache_size_mb = 256;
        storage = std::make_unique<RocksDBWrapper>(cfg);
        if (!storage->open()) {
            throw std::runtime_error("Failed to open RocksDB for benchmark");
        }
        store = std::make_unique<RocksDBStore>(*storage);
        registry = quarry::schema::SchemaRegistry::fromYamlString(kBenchSchema);

        for (size_t i = 0; i < N; ++i) {
            Record r;
            r.key = userKey(i);
            r.set("name", std::string("User ") + std::to_string(i));
            r.set("age", static_cast<int64_t>(i % 100));
            store->put(r);
        }
        ready = true;
    }
};

} // namespace

static void BM_CompilePredicate(benchmark::State& state) {
    // Args: number of AND-ed equality terms
    const int terms = static_cast<int>(state.range(0));
    auto registry = quarry::schema::SchemaRegistry::fromYamlString(kBenchSchema);
    const auto& cls = *registry.metadataFor("User");

    NodePtr filter;
    for (int i = 0; i < terms; ++i) {
        auto term = makeEq(member(i % 2 == 0 ? "age" : "name"), makeLiteral(static_cast<int64_t>(i)));
        filter = filter ? makeAnd(filter, term) : term;
    }
    auto compilation = selectUsers(filter);
    QueryParameters params;

    for (auto _ : state) {
        PredicateCompiler compiler(compilation, cls, params);
        auto result = compiler.compile();
        benchmark::DoNotOptimize(result);
    }
    state.counters["terms"] = terms;
}

static void BM_Scan_Window(benchmark::State& state) {
    // Args: page_size, pages
    const int pageSize = static_cast<int>(state.range(0));
    const int pages = static_cast<int>(state.range(1));
    auto& env = BenchEnv::instance(); env.initOnce();
    JsonMaterializer materializer;
    QueryExecutor executor(*env.store, env.registry, materializer);
    auto compilation = selectUsers(makeComparison(Operator::Gte, member("age"), makeLiteral(50)));
    QueryParameters params;

    for (auto _ : state) {
        size_t totalFetched = 0;
        for (int p = 0; p < pages; ++p) {
            int64_t from = static_cast<int64_t>(p) * pageSize;
            try {
                auto result = executor.execute(compilation, from, from + pageSize, params);
                totalFetched += result.rows->size();
            } catch (const QueryError& e) {
                state.SkipWithError(e.what());
                return;
            }
        }
        state.counters["pages"] = pages;
        state.counters["page_size"] = pageSize;
        state.counters["fetched_items"] = static_cast<double>(totalFetched);
    }
}

static void BM_BatchLookup(benchmark::State& state) {
    // Args: number of keys
    const int keys = static_cast<int>(state.range(0));
    auto& env = BenchEnv::instance(); env.initOnce();
    JsonMaterializer materializer;
    QueryExecutor executor(*env.store, env.registry, materializer);

    ValueList ids;
    for (int i = 0; i < keys; ++i) {
        ids.push_back(Value(BenchEnv::userKey(static_cast<size_t>(i) * 7)));
    }
    QueryParameters params;
    params.set("ids", ids);
    auto compilation = selectUsers(makeEq(member("id"), makeParameter("ids")));

    for (auto _ : state) {
        try {
            auto result = executor.execute(compilation, std::nullopt, std::nullopt, params);
            benchmark::DoNotOptimize(result.rows->size());
        } catch (const QueryError& e) {
            state.SkipWithError(e.what());
            return;
        }
    }
    state.counters["keys"] = keys;
}

BENCHMARK(BM_CompilePredicate)->Arg(4)->Arg(32);
BENCHMARK(BM_Scan_Window)->Args({50, 20})->Unit(benchmark::kMillisecond);
BENCHMARK(BM_BatchLookup)->Arg(10)->Arg(500)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
