#include "query/query_executor.h"
#include "query/query_errors.h"
#include "query/sort_compiler.h"
#include "utils/logger.h"
#include "utils/tracing.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <stdexcept>

namespace quarry {
namespace query {

ExecutorOptions ExecutorOptions::fromConfig(const EngineConfig& config) {
    ExecutorOptions options;
    options.excludeAncestorQueriesFromTxn = config.query.exclude_ancestor_queries_from_txn;
    options.accurateDelete = config.query.accurate_delete;
    return options;
}

QueryExecutor::QueryExecutor(StoreClient& store, const schema::MetadataProvider& metadata,
                             Materializer& materializer, ExecutorOptions options)
    : store_(store), metadata_(metadata), materializer_(materializer), options_(std::move(options)) {}

bool QueryExecutor::flag(const QueryCompilation& compilation, const char* extension, bool fallback) const {
    return compilation.extension(extension).value_or(fallback);
}

// ---------------------------------------------------------------------------
// Validation and compilation
// ---------------------------------------------------------------------------

const schema::ClassMetadata& QueryExecutor::validate(const QueryCompilation& compilation) {
    const auto& queryText = compilation.queryText;

    for (const auto& from : compilation.from) {
        if (!from.joins.empty()) {
            throw UnsupportedFeatureError(queryText, "Joins are not supported.");
        }
    }

    const auto* cls = metadata_.metadataFor(compilation.candidateType);
    if (!cls) {
        throw QueryValidationError(queryText, "No meta-data for class " + compilation.candidateType);
    }
    if (compilation.type == QueryType::BulkUpdate) {
        throw QueryValidationError(queryText, "Only select and delete statements are supported.");
    }
    if (!compilation.grouping.empty()) {
        throw UnsupportedOperatorError(queryText, "GROUP BY");
    }
    if (compilation.having) {
        throw UnsupportedOperatorError(queryText, "HAVING");
    }
    return *cls;
}

QueryExecutor::Plan QueryExecutor::plan(const QueryCompilation& compilation, const QueryParameters& params) {
    Plan p;
    p.cls = &validate(compilation);
    p.shape = ResultShapeValidator(compilation, *p.cls).validate();

    PredicateCompiler predicates(compilation, *p.cls, params, options_.clock);
    PredicateResult compiled = predicates.compile();
    bool batch = std::holds_alternative<BatchLookup>(compiled);
    auto sorts = SortCompiler(compilation, *p.cls).compile(batch);

    if (batch) {
        p.query = std::get<BatchLookup>(std::move(compiled));
    } else {
        auto& filterSet = std::get<FilterSet>(compiled);
        ScanQuery scan;
        scan.kind = p.cls->kind;
        scan.filters = std::move(filterSet.filters);
        scan.ancestor = std::move(filterSet.ancestor);
        scan.sorts = std::move(sorts);
        scan.keysOnly = p.shape.kind == ResultShape::Kind::KeysOnly || compilation.type == QueryType::BulkDelete;
        p.query = std::move(scan);
    }
    return p;
}

// ---------------------------------------------------------------------------
// Execution
// ---------------------------------------------------------------------------

QueryResult QueryExecutor::execute(const QueryCompilation& compilation,
                                   std::optional<int64_t> fromInclusive,
                                   std::optional<int64_t> toExclusive,
                                   const QueryParameters& params,
                                   const CancellationToken& token) {
    const auto& queryText = compilation.queryText;
    auto started = std::chrono::steady_clock::now();
    ScopedSpan span("QueryExecutor.execute");
    span.setAttribute("query.kind", compilation.candidateType);
    QUARRY_DEBUG("Executing query {}", queryText);

    try {
        Plan p = plan(compilation, params);
        latest_ = p.query;
        span.setAttribute("query.shape", resultShapeName(p.shape.kind));

        RangeWindow window;
        try {
            window = computeRangeWindow(fromInclusive, toExclusive);
        } catch (const std::invalid_argument& e) {
            throw QueryValidationError(queryText, e.what());
        }
        if (window.empty) {
            QUARRY_DEBUG("Range [{}, {}) is empty; skipping store for {}", fromInclusive.value_or(0),
                         toExclusive.value_or(0), queryText);
            return emptyResult(compilation, p.shape);
        }
        if (p.shape.isCount() && window.isSet()) {
            throw UnsupportedFeatureError(queryText,
                "The datastore does not support using count() in conjunction with offset and/or limit.");
        }

        QueryResult result = std::visit(overloaded{
            [&](const ScanQuery& scan) {
                span.setAttribute("query.mode", "scan");
                span.setAttribute("query.filter_count", static_cast<int64_t>(scan.filters.size()));
                return dispatchScan(compilation, p, scan, window, token);
            },
            [&](const BatchLookup& lookup) {
                span.setAttribute("query.mode", "batch");
                return dispatchBatch(compilation, p, lookup, window, token);
            }
        }, p.query);

        if (result.kind != QueryResult::Kind::Rows) {
            span.setAttribute("query.result_count", result.count);
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        QUARRY_DEBUG("Query {} dispatched in {} ms", queryText, elapsed);
        return result;
    } catch (const QueryError& e) {
        span.recordError(e.what());
        throw;
    } catch (const StoreError& e) {
        span.recordError(e.what());
        QUARRY_ERROR("Store failure executing {}: {}", queryText, e.what());
        throw StoreAccessError(queryText, e.what());
    }
}

QueryResult QueryExecutor::emptyResult(const QueryCompilation& compilation, const ResultShape& shape) const {
    QueryResult result;
    if (compilation.type == QueryType::BulkDelete) {
        result.kind = QueryResult::Kind::Deleted;
    } else if (shape.isCount()) {
        result.kind = QueryResult::Kind::Count;
    } else {
        result.rows = StreamingResult::empty(compilation.queryText);
    }
    return result;
}

StreamingResult::Converter QueryExecutor::converterFor(const Plan& plan) {
    const schema::ClassMetadata& cls = *plan.cls;
    Materializer& materializer = materializer_;
    switch (plan.shape.kind) {
        case ResultShape::Kind::KeysOnly:
            return [&materializer, &cls](const Record& r) { return materializer.buildIdentifierOnly(r, cls); };
        case ResultShape::Kind::FieldProjection:
            return [&materializer, &cls, fields = plan.shape.projection](const Record& r) {
                return materializer.buildProjection(r, cls, fields);
            };
        default:
            return [&materializer, &cls](const Record& r) { return materializer.buildWhole(r, cls); };
    }
}

QueryResult QueryExecutor::dispatchScan(const QueryCompilation& compilation, const Plan& plan,
                                        const ScanQuery& scan, const RangeWindow& window,
                                        const CancellationToken& token) {
    StoreTransaction* txn = nullptr;
    if (scan.ancestor &&
        !flag(compilation, kExtExcludeQueryFromTxn, options_.excludeAncestorQueriesFromTxn)) {
        txn = store_.currentTransaction();
    }
    QUARRY_DEBUG("Native query: {} {}", scan.toString(), window.toString());

    QueryResult result;
    if (compilation.type == QueryType::BulkDelete) {
        auto cursor = store_.scan(scan, window, txn);
        std::vector<Key> keys;
        while (auto record = cursor->next()) {
            keys.push_back(std::move(record->key));
        }
        if (!keys.empty()) {
            store_.remove(keys, store_.currentTransaction());
        }
        QUARRY_INFO("Deleted {} records of kind {}", keys.size(), scan.kind);
        result.kind = QueryResult::Kind::Deleted;
        result.count = static_cast<int64_t>(keys.size());
        return result;
    }

    if (plan.shape.isCount()) {
        result.kind = QueryResult::Kind::Count;
        result.count = store_.count(scan, txn);
        return result;
    }

    result.rows = std::make_unique<StreamingResult>(store_.scan(scan, window, txn), converterFor(plan), token,
                                                    compilation.queryText);
    return result;
}

QueryResult QueryExecutor::dispatchBatch(const QueryCompilation& compilation, const Plan& plan,
                                         const BatchLookup& lookup, const RangeWindow& window,
                                         const CancellationToken& token) {
    if (lookup.keys.empty()) {
        QUARRY_DEBUG("Batch lookup without keys; skipping store for {}", compilation.queryText);
        return emptyResult(compilation, plan.shape);
    }
    StoreTransaction* txn = store_.currentTransaction();
    QUARRY_DEBUG("Native query: {}", lookup.toString());

    QueryResult result;
    if (compilation.type == QueryType::BulkDelete) {
        std::vector<Key> keys = lookup.keys;
        if (flag(compilation, kExtAccurateDelete, options_.accurateDelete)) {
            auto found = store_.get(lookup.keys, txn);
            keys.clear();
            for (const auto& key : lookup.keys) {
                if (found.count(key)) keys.push_back(key);
            }
        }
        if (!keys.empty()) {
            store_.remove(keys, txn);
        }
        result.kind = QueryResult::Kind::Deleted;
        result.count = static_cast<int64_t>(keys.size());
        return result;
    }

    auto found = store_.get(lookup.keys, txn);
    std::vector<Record> records;
    records.reserve(found.size());
    for (const auto& key : lookup.keys) {
        auto it = found.find(key);
        if (it != found.end()) {
            records.push_back(std::move(it->second));
        }
    }

    if (plan.shape.isCount()) {
        result.kind = QueryResult::Kind::Count;
        result.count = static_cast<int64_t>(records.size());
        return result;
    }

    size_t begin = std::min(records.size(), static_cast<size_t>(window.offset.value_or(0)));
    size_t end = records.size();
    if (window.limit) {
        end = std::min(end, begin + static_cast<size_t>(*window.limit));
    }
    std::vector<Record> page(std::make_move_iterator(records.begin() + begin),
                             std::make_move_iterator(records.begin() + end));
    result.rows = std::make_unique<StreamingResult>(std::make_unique<VectorRecordCursor>(std::move(page)),
                                                    converterFor(plan), token, compilation.queryText);
    return result;
}

} // namespace query
} // namespace quarry
