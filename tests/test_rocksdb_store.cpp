#include <gtest/gtest.h>

#include "query/query_errors.h"
#include "query/query_executor.h"
#include "storage/rocksdb_store.h"
#include "storage/rocksdb_wrapper.h"
#include "query_test_support.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

using namespace quarry;
using namespace quarry::query;
using quarry::testing::field;
using quarry::testing::selectPeople;

static std::string tmpPath(const std::string& name) {
    namespace fs = std::filesystem;
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return (fs::temp_directory_path() / (name + std::to_string(now))).string();
}

class RocksDBStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg_.db_path = tmpPath("quarry_store_");
        db_ = std::make_unique<RocksDBWrapper>(cfg_);
        ASSERT_TRUE(db_->open()) << db_->lastError();
        store_ = std::make_unique<RocksDBStore>(*db_);
        registry_ = quarry::testing::personRegistry();

        put("acme", 1, "Ada", 36);
        put("acme", 2, "Grace", 45);
        put("acme", 3, "Barbara", 52);
        put("globex", 4, "Edsger", 45);
        put("acme2", 5, "Alan", 41);
    }

    void TearDown() override {
        store_.reset();
        db_->close();
        std::error_code ec;
        std::filesystem::remove_all(cfg_.db_path, ec);
    }

    static Key personKey(const std::string& company, int64_t id) {
        return Key::fromName("company", company).child("person", id);
    }

    void put(const std::string& company, int64_t id, const std::string& first, int64_t age) {
        Record r;
        r.key = personKey(company, id);
        r.set("firstName", first);
        r.set("age", age);
        store_->put(r);
    }

    QueryResult run(const QueryCompilation& c, std::optional<int64_t> from = std::nullopt,
                    std::optional<int64_t> to = std::nullopt) {
        QueryExecutor executor(*store_, registry_, materializer_);
        return executor.execute(c, from, to, params_);
    }

    bool stored(const Key& key) {
        std::optional<std::string> value;
        EXPECT_TRUE(db_->get(RocksDBStore::storageKey(key), value)) << db_->lastError();
        return value.has_value();
    }

    static std::vector<std::string> names(QueryResult& result) {
        std::vector<std::string> out;
        for (const auto& row : *result.rows) {
            out.push_back(row["firstName"].get<std::string>());
        }
        return out;
    }

    RocksDBWrapper::Config cfg_;
    std::unique_ptr<RocksDBWrapper> db_;
    std::unique_ptr<RocksDBStore> store_;
    schema::SchemaRegistry registry_;
    JsonMaterializer materializer_;
    QueryParameters params_;
};

TEST_F(RocksDBStoreTest, StorageKeyIsKindScoped) {
    EXPECT_EQ(RocksDBStore::storageKey(personKey("acme", 1)), "ent:person:company:nacme/person:i1");
}

TEST_F(RocksDBStoreTest, EqualityAndRangeFilters) {
    auto result = run(selectPeople(makeEq(field("age"), makeLiteral(45))));
    auto found = names(result);
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found, (std::vector<std::string>{"Edsger", "Grace"}));

    auto older = run(selectPeople(makeAnd(makeComparison(Operator::Gt, field("age"), makeLiteral(40)),
                                          makeComparison(Operator::Lte, field("age"), makeLiteral(45)))));
    EXPECT_EQ(older.rows->size(), 3u);
}

TEST_F(RocksDBStoreTest, PrefixFilter) {
    auto result = run(selectPeople(makeCall("startsWith", field("firstName"), {makeLiteral("A")})));
    auto found = names(result);
    std::sort(found.begin(), found.end());
    EXPECT_EQ(found, (std::vector<std::string>{"Ada", "Alan"}));
}

TEST_F(RocksDBStoreTest, AncestorScopesTheScan) {
    auto result = run(selectPeople(makeEq(field("company"), makeLiteral("company:nacme"))));
    EXPECT_EQ(result.rows->size(), 3u);
    for (const auto& row : *result.rows) {
        EXPECT_EQ(row["company"], "company:nacme");
    }
}

TEST_F(RocksDBStoreTest, SortedScanWithWindow) {
    auto c = selectPeople();
    c.ordering.push_back(OrderEntry{field("age"), std::string("descending")});
    c.ordering.push_back(OrderEntry{field("firstName"), std::nullopt});

    auto all = run(c);
    EXPECT_EQ(names(all), (std::vector<std::string>{"Barbara", "Edsger", "Grace", "Alan", "Ada"}));

    auto page = run(c, 1, 3);
    EXPECT_EQ(names(page), (std::vector<std::string>{"Edsger", "Grace"}));
}

TEST_F(RocksDBStoreTest, UnsortedScanHonoursWindow) {
    auto page = run(selectPeople(), 1, 3);
    EXPECT_EQ(page.rows->size(), 2u);
}

TEST_F(RocksDBStoreTest, SortByKey) {
    auto c = selectPeople(makeEq(field("company"), makeLiteral("company:nacme")));
    c.ordering.push_back(OrderEntry{field("id"), std::string("descending")});
    c.result.push_back(field("this"));
    auto result = run(c);
    ASSERT_EQ(result.rows->size(), 3u);
    EXPECT_EQ(result.rows->at(0), "company:nacme/person:i3");
    EXPECT_EQ(result.rows->at(2), "company:nacme/person:i1");
}

TEST_F(RocksDBStoreTest, Count) {
    auto c = selectPeople(makeComparison(Operator::Gte, field("age"), makeLiteral(45)));
    c.result.push_back(makeCall("count", nullptr));
    auto result = run(c);
    EXPECT_EQ(result.kind, QueryResult::Kind::Count);
    EXPECT_EQ(result.count, 3);
}

TEST_F(RocksDBStoreTest, BatchLookup) {
    params_.set("ids", ValueList{Value(personKey("globex", 4)), Value(personKey("acme", 1))});
    auto result = run(selectPeople(makeEq(field("id"), makeParameter("ids"))));
    EXPECT_EQ(names(result), (std::vector<std::string>{"Edsger", "Ada"}));
}

TEST_F(RocksDBStoreTest, ScanDeleteRemovesMatchingRecords) {
    auto del = selectPeople(makeEq(field("age"), makeLiteral(45)));
    del.type = QueryType::BulkDelete;
    auto deleted = run(del);
    EXPECT_EQ(deleted.kind, QueryResult::Kind::Deleted);
    EXPECT_EQ(deleted.count, 2);

    auto rest = run(selectPeople());
    EXPECT_EQ(rest.rows->size(), 3u);
}

TEST_F(RocksDBStoreTest, DeleteInsideTransactionIsInvisibleUntilCommit) {
    auto txn = store_->beginTransaction();
    EXPECT_EQ(store_->currentTransaction(), txn.get());
    EXPECT_THROW(store_->beginTransaction(), StoreError);

    params_.set("ids", ValueList{Value(personKey("acme", 1))});
    auto del = selectPeople(makeEq(field("id"), makeParameter("ids")));
    del.type = QueryType::BulkDelete;
    EXPECT_EQ(run(del).count, 1);

    EXPECT_TRUE(stored(personKey("acme", 1)));
    ASSERT_TRUE(txn->commit());
    EXPECT_EQ(store_->currentTransaction(), nullptr);
    EXPECT_FALSE(stored(personKey("acme", 1)));
}

TEST_F(RocksDBStoreTest, RollbackKeepsRecords) {
    {
        auto txn = store_->beginTransaction();
        auto del = selectPeople();
        del.type = QueryType::BulkDelete;
        EXPECT_EQ(run(del).count, 5);
        txn->rollback();
    }
    EXPECT_EQ(store_->currentTransaction(), nullptr);
    EXPECT_EQ(run(selectPeople()).rows->size(), 5u);
}

TEST_F(RocksDBStoreTest, AncestorQueryReadsOwnTransactionWrites) {
    auto txn = store_->beginTransaction();
    put("acme", 6, "Frances", 29);

    auto inTxn = run(selectPeople(makeEq(field("company"), makeLiteral("company:nacme"))));
    EXPECT_EQ(inTxn.rows->size(), 4u);

    auto outside = run(selectPeople(makeEq(field("age"), makeLiteral(29))));
    EXPECT_EQ(outside.rows->size(), 0u);

    txn->rollback();
}

TEST_F(RocksDBStoreTest, ClosedDatabaseSurfacesStoreAccessError) {
    db_->close();
    EXPECT_THROW(run(selectPeople()), StoreAccessError);
}

TEST_F(RocksDBStoreTest, TransactionalScanSurvivesCommitMidStream) {
    auto txn = store_->beginTransaction();
    auto result = run(selectPeople(makeEq(field("company"), makeLiteral("company:nacme"))));
    EXPECT_EQ(result.rows->at(0)["firstName"], "Ada");

    ASSERT_TRUE(txn->commit());
    txn.reset();

    EXPECT_EQ(result.rows->size(), 3u);
    EXPECT_EQ(names(result), (std::vector<std::string>{"Ada", "Grace", "Barbara"}));
}

TEST_F(RocksDBStoreTest, ReadFailureIsNotReportedAsMissing) {
    std::optional<std::string> value;
    EXPECT_TRUE(db_->get(RocksDBStore::storageKey(personKey("acme", 9)), value));
    EXPECT_FALSE(value.has_value());

    auto txn = db_->beginTransaction();
    txn->rollback();
    EXPECT_FALSE(txn->get(RocksDBStore::storageKey(personKey("acme", 1)), value));
    EXPECT_FALSE(txn->lastError().empty());

    db_->close();
    EXPECT_FALSE(db_->get(RocksDBStore::storageKey(personKey("acme", 1)), value));
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(db_->lastError(), "database not open");
    EXPECT_THROW(store_->get({personKey("acme", 1)}, nullptr), StoreError);
}
