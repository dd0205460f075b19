// Example: compiling and running object queries against a local RocksDB store

#include "config/engine_config.h"
#include "query/query_errors.h"
#include "query/query_executor.h"
#include "schema/schema_registry.h"
#include "storage/rocksdb_store.h"
#include "utils/logger.h"
#include "utils/tracing.h"

#include <iostream>

using namespace quarry;
using namespace quarry::query;

namespace {

const char* kSchema = R"(
classes:
  - type: Person
    kind: person
    members:
      - { name: id, type: key, primary_key: true }
      - { name: company, type: key, parent_key: true }
      - { name: firstName, type: string }
      - { name: age, type: integer }
)";

Record person(const std::string& company, int64_t id, const std::string& first, int64_t age) {
    Record r;
    r.key = Key::fromName("company", company).child("person", id);
    r.set("firstName", first);
    r.set("age", age);
    return r;
}

QueryCompilation selectPeople(NodePtr filter) {
    QueryCompilation c;
    c.queryText = "SELECT FROM Person WHERE " + (filter ? filter->toString() : std::string("true"));
    c.candidateType = "Person";
    c.from.push_back(FromClause{"Person", "this", {}});
    c.filter = std::move(filter);
    return c;
}

} // namespace

int main(int argc, char** argv) {
    EngineConfig config = argc > 1 ? EngineConfig::loadFromYaml(argv[1]) : EngineConfig();
    utils::Logger::init(config.logging.file, utils::Logger::levelFromString(config.logging.level));
    if (!config.logging.pattern.empty()) {
        utils::Logger::setPattern(config.logging.pattern);
    }
    if (config.tracing.enabled) {
        Tracer::initialize(config.tracing.service_name, config.tracing.endpoint);
    }

    RocksDBWrapper db(config.rocksdbConfig());
    if (!db.open()) {
        std::cerr << "Failed to open store: " << db.lastError() << "\n";
        return 1;
    }
    RocksDBStore store(db);
    auto registry = schema::SchemaRegistry::fromYamlString(kSchema);
    JsonMaterializer materializer;
    QueryExecutor executor(store, registry, materializer, ExecutorOptions::fromConfig(config));

    try {
        store.put(person("acme", 1, "Ada", 36));
        store.put(person("acme", 2, "Grace", 45));
        store.put(person("globex", 3, "Edsger", 45));

        // 1. Ancestor-scoped scan with a range filter and ordering
        auto scan = selectPeople(makeAnd(makeEq(makeIdentifier({"company"}), makeLiteral("company:nacme")),
                                         makeComparison(Operator::Gt, makeIdentifier({"age"}), makeLiteral(30))));
        scan.ordering.push_back(OrderEntry{makeIdentifier({"age"}), std::string("descending")});
        QueryParameters none;
        auto rows = executor.execute(scan, std::nullopt, std::nullopt, none);
        std::cout << "Native query: " << toString(*executor.latestNativeQuery()) << "\n";
        for (const auto& row : *rows.rows) {
            std::cout << row.dump() << "\n";
        }

        // 2. Batch lookup by primary key
        QueryParameters params;
        params.set("ids", ValueList{Value(Key::fromName("company", "globex").child("person", 3))});
        auto batch = executor.execute(selectPeople(makeEq(makeIdentifier({"id"}), makeParameter("ids"))),
                                      std::nullopt, std::nullopt, params);
        std::cout << "Native query: " << toString(*executor.latestNativeQuery()) << "\n";
        std::cout << "Batch lookup returned " << batch.rows->size() << " record(s)\n";

        // 3. A disjunction is rejected before the store is touched
        executor.execute(selectPeople(makeOr(makeEq(makeIdentifier({"age"}), makeLiteral(1)),
                                             makeEq(makeIdentifier({"age"}), makeLiteral(2)))),
                         std::nullopt, std::nullopt, none);
    } catch (const UnsupportedFeatureError& e) {
        std::cout << "Rejected: " << e.what() << "\n";
    } catch (const QueryError& e) {
        std::cerr << "Query failed: " << e.what() << "\n";
        return 1;
    } catch (const StoreError& e) {
        std::cerr << "Store failed: " << e.what() << "\n";
        return 1;
    }

    Tracer::shutdown();
    utils::Logger::shutdown();
    return 0;
}
