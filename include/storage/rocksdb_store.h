#pragma once

#include "storage/rocksdb_wrapper.h"
#include "storage/store_client.h"

#include <memory>
#include <string>

namespace quarry {

/**
 * StoreClient over RocksDB. Each record is a JSON document under
 * "ent:<kind>:<key text>", so an ancestor-scoped scan seeks straight to the
 * ancestor's key-text prefix. Filters and sorts are evaluated while
 * iterating. Unsorted scans outside a transaction stream from the
 * iterator. Sorted scans and scans inside a transaction materialise the
 * matching set first.
 */
class RocksDBStore : public StoreClient {
public:
    /// Transaction that stays current on the store until commit/rollback.
    class Transaction : public StoreTransaction {
    public:
        Transaction(RocksDBStore& store, std::unique_ptr<RocksDBWrapper::TransactionWrapper> txn)
            : store_(store), txn_(std::move(txn)) {}
        ~Transaction() override;

        bool isActive() const override { return txn_ && txn_->isActive(); }
        bool commit();
        void rollback();

        RocksDBWrapper::TransactionWrapper& wrapper() { return *txn_; }

    private:
        RocksDBStore& store_;
        std::unique_ptr<RocksDBWrapper::TransactionWrapper> txn_;
    };

    explicit RocksDBStore(RocksDBWrapper& db) : db_(db) {}

    /// Starts a transaction and makes it current. Throws StoreError if one is already current.
    std::unique_ptr<Transaction> beginTransaction();

    /// Writes a record, inside the current transaction when there is one.
    void put(const Record& record);

    std::unique_ptr<RecordCursor> scan(const query::ScanQuery& query,
                                       const query::RangeWindow& window,
                                       StoreTransaction* txn) override;
    std::map<Key, Record> get(const std::vector<Key>& keys, StoreTransaction* txn) override;
    void remove(const std::vector<Key>& keys, StoreTransaction* txn) override;
    int64_t count(const query::ScanQuery& query, StoreTransaction* txn) override;
    StoreTransaction* currentTransaction() override { return current_; }

    static std::string storageKey(const Key& key);
    static bool matches(const Record& record, const query::ScanQuery& query);

private:
    RocksDBWrapper::TransactionWrapper* wrapperFor(StoreTransaction* txn);

    RocksDBWrapper& db_;
    Transaction* current_ = nullptr;
};

} // namespace quarry
