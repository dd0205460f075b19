#pragma once

#include "config/engine_config.h"
#include "query/materializer.h"
#include "query/native_query.h"
#include "query/predicate_compiler.h"
#include "query/query_compilation.h"
#include "query/range_window.h"
#include "query/result_shape.h"
#include "query/streaming_result.h"
#include "schema/metadata.h"
#include "storage/store_client.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace quarry {
namespace query {

struct QueryResult {
    enum class Kind { Rows, Count, Deleted };

    Kind kind = Kind::Rows;
    // Rows only
    std::unique_ptr<StreamingResult> rows;
    // Count: matching records. Deleted: keys submitted for deletion.
    int64_t count = 0;
};

struct ExecutorOptions {
    bool excludeAncestorQueriesFromTxn = false;
    bool accurateDelete = false;
    // Source of CURRENT_TIMESTAMP; system clock when empty
    PredicateCompiler::Clock clock;

    static ExecutorOptions fromConfig(const EngineConfig& config);
};

/**
 * Runs an object query against a store.
 *
 * Each call validates the compilation (metadata, statement type, joins,
 * grouping, result shape), compiles filters and ordering, computes the
 * range window and dispatches to a scan or a batch key lookup. Every
 * rejection happens before the first store call.
 */
class QueryExecutor {
public:
    QueryExecutor(StoreClient& store, const schema::MetadataProvider& metadata,
                  Materializer& materializer, ExecutorOptions options = {});

    QueryResult execute(const QueryCompilation& compilation,
                        std::optional<int64_t> fromInclusive,
                        std::optional<int64_t> toExclusive,
                        const QueryParameters& params,
                        const CancellationToken& token = CancellationToken());

    /// Native form of the most recently compiled query.
    const std::optional<CompiledQuery>& latestNativeQuery() const { return latest_; }

private:
    struct Plan {
        const schema::ClassMetadata* cls = nullptr;
        ResultShape shape;
        CompiledQuery query;
    };

    Plan plan(const QueryCompilation& compilation, const QueryParameters& params);
    const schema::ClassMetadata& validate(const QueryCompilation& compilation);

    QueryResult dispatchScan(const QueryCompilation& compilation, const Plan& plan,
                             const ScanQuery& scan, const RangeWindow& window, const CancellationToken& token);
    QueryResult dispatchBatch(const QueryCompilation& compilation, const Plan& plan,
                              const BatchLookup& lookup, const RangeWindow& window, const CancellationToken& token);

    StreamingResult::Converter converterFor(const Plan& plan);
    QueryResult emptyResult(const QueryCompilation& compilation, const ResultShape& shape) const;
    bool flag(const QueryCompilation& compilation, const char* extension, bool fallback) const;

    StoreClient& store_;
    const schema::MetadataProvider& metadata_;
    Materializer& materializer_;
    ExecutorOptions options_;
    std::optional<CompiledQuery> latest_;
};

} // namespace query
} // namespace quarry
