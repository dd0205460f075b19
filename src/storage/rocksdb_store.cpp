#include "storage/rocksdb_store.h"
#include "utils/logger.h"

#include <rocksdb/iterator.h>

#include <algorithm>
#include <optional>

namespace quarry {

namespace {

constexpr const char* kRecordPrefix = "ent:";

std::string kindPrefix(const std::string& kind) {
    return std::string(kRecordPrefix) + kind + ":";
}

Record decodeRecord(std::string_view storageKey, std::string_view value) {
    try {
        return Record::fromJson(nlohmann::json::parse(value));
    } catch (const std::exception& e) {
        throw StoreError("Corrupt record at " + std::string(storageKey) + ": " + e.what());
    }
}

std::optional<PropertyValue> propertyOf(const Record& record, const std::string& property) {
    if (property == query::kKeyProperty) {
        return PropertyValue(record.key);
    }
    return record.get(property);
}

bool satisfies(const PropertyValue& actual, const query::NativeFilter& filter) {
    int c = compareProperty(actual, filter.value);
    switch (filter.op) {
        case query::FilterOperator::Equal: return c == 0;
        case query::FilterOperator::GreaterThan: return c > 0;
        case query::FilterOperator::GreaterThanOrEqual: return c >= 0;
        case query::FilterOperator::LessThan: return c < 0;
        case query::FilterOperator::LessThanOrEqual: return c <= 0;
    }
    return false;
}

Record project(Record record, bool keysOnly) {
    if (keysOnly) {
        record.properties.clear();
    }
    return record;
}

// Streams matching records straight from a RocksDB iterator
class IteratorCursor : public RecordCursor {
public:
    IteratorCursor(std::unique_ptr<rocksdb::Iterator> it, std::string prefix, query::ScanQuery query,
                   const query::RangeWindow& window)
        : it_(std::move(it)),
          prefix_(std::move(prefix)),
          query_(std::move(query)),
          skip_(window.offset.value_or(0)),
          remaining_(window.limit) {
        it_->Seek(prefix_);
    }

    std::optional<Record> next() override {
        if (remaining_ && *remaining_ <= 0) return std::nullopt;
        for (; it_->Valid() && it_->key().starts_with(prefix_); it_->Next()) {
            std::string_view key(it_->key().data(), it_->key().size());
            Record record = decodeRecord(key, std::string_view(it_->value().data(), it_->value().size()));
            if (!RocksDBStore::matches(record, query_)) continue;
            if (skip_ > 0) {
                --skip_;
                continue;
            }
            it_->Next();
            if (remaining_) --*remaining_;
            return project(std::move(record), query_.keysOnly);
        }
        if (!it_->status().ok()) {
            throw StoreError("Scan of kind " + query_.kind + " failed: " + it_->status().ToString());
        }
        return std::nullopt;
    }

private:
    std::unique_ptr<rocksdb::Iterator> it_;
    std::string prefix_;
    query::ScanQuery query_;
    int64_t skip_;
    std::optional<int64_t> remaining_;
};

} // namespace

RocksDBStore::Transaction::~Transaction() {
    if (store_.current_ == this) {
        store_.current_ = nullptr;
    }
}

bool RocksDBStore::Transaction::commit() {
    bool ok = txn_->commit();
    if (store_.current_ == this) store_.current_ = nullptr;
    return ok;
}

void RocksDBStore::Transaction::rollback() {
    txn_->rollback();
    if (store_.current_ == this) store_.current_ = nullptr;
}

std::unique_ptr<RocksDBStore::Transaction> RocksDBStore::beginTransaction() {
    if (current_) {
        throw StoreError("A transaction is already active on this store");
    }
    auto txn = std::make_unique<Transaction>(*this, db_.beginTransaction());
    if (!txn->isActive()) {
        throw StoreError("Failed to begin transaction: database not open");
    }
    current_ = txn.get();
    return txn;
}

std::string RocksDBStore::storageKey(const Key& key) {
    return kindPrefix(key.kind()) + key.toString();
}

bool RocksDBStore::matches(const Record& record, const query::ScanQuery& query) {
    if (query.ancestor && !record.key.hasAncestor(*query.ancestor)) {
        return false;
    }
    for (const auto& filter : query.filters) {
        auto actual = propertyOf(record, filter.property);
        if (!actual || !satisfies(*actual, filter)) {
            return false;
        }
    }
    return true;
}

RocksDBWrapper::TransactionWrapper* RocksDBStore::wrapperFor(StoreTransaction* txn) {
    if (!txn) return nullptr;
    auto* own = dynamic_cast<Transaction*>(txn);
    if (!own) {
        throw StoreError("Transaction does not belong to this store");
    }
    if (!own->isActive()) {
        throw StoreError("Transaction is no longer active");
    }
    return &own->wrapper();
}

void RocksDBStore::put(const Record& record) {
    if (!record.key.isValid()) {
        throw StoreError("Cannot store a record without a key");
    }
    std::string key = storageKey(record.key);
    std::string value = record.toJson().dump();
    bool ok = current_ ? current_->wrapper().put(key, value) : db_.put(key, value);
    if (!ok) {
        throw StoreError("Failed to write " + record.key.debugString() + ": " + db_.lastError());
    }
}

std::unique_ptr<RecordCursor> RocksDBStore::scan(const query::ScanQuery& query,
                                                 const query::RangeWindow& window,
                                                 StoreTransaction* txn) {
    auto* wrapper = wrapperFor(txn);
    std::unique_ptr<rocksdb::Iterator> it = wrapper ? wrapper->newIterator() : db_.newIterator();
    if (!it) {
        throw StoreError("Cannot scan kind " + query.kind + ": database not open");
    }

    std::string prefix = kindPrefix(query.kind);
    if (query.ancestor) {
        prefix += query.ancestor->toString();
    }

    if (query.sorts.empty() && !wrapper) {
        return std::make_unique<IteratorCursor>(std::move(it), std::move(prefix), query, window);
    }

    // A transaction iterator must not outlive its transaction, so those scans are read up front
    if (query.sorts.empty()) {
        std::vector<Record> rows;
        IteratorCursor cursor(std::move(it), std::move(prefix), query, window);
        while (auto record = cursor.next()) {
            rows.push_back(std::move(*record));
        }
        return std::make_unique<VectorRecordCursor>(std::move(rows));
    }

    // Sorted scans need the full matching set; records lacking a sort property drop out
    auto full = query;
    full.keysOnly = false;
    std::vector<Record> matched;
    IteratorCursor all(std::move(it), prefix, full, query::RangeWindow{});
    while (auto record = all.next()) {
        bool sortable = std::all_of(query.sorts.begin(), query.sorts.end(), [&](const query::SortClause& s) {
            return propertyOf(*record, s.property).has_value();
        });
        if (sortable) matched.push_back(std::move(*record));
    }

    std::stable_sort(matched.begin(), matched.end(), [&](const Record& a, const Record& b) {
        for (const auto& s : query.sorts) {
            int c = compareProperty(*propertyOf(a, s.property), *propertyOf(b, s.property));
            if (c != 0) {
                return s.direction == query::SortDirection::Ascending ? c < 0 : c > 0;
            }
        }
        return false;
    });

    size_t begin = std::min<size_t>(matched.size(), static_cast<size_t>(window.offset.value_or(0)));
    size_t end = matched.size();
    if (window.limit) {
        end = std::min(end, begin + static_cast<size_t>(*window.limit));
    }
    std::vector<Record> page;
    page.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        page.push_back(project(std::move(matched[i]), query.keysOnly));
    }
    return std::make_unique<VectorRecordCursor>(std::move(page));
}

std::map<Key, Record> RocksDBStore::get(const std::vector<Key>& keys, StoreTransaction* txn) {
    auto* wrapper = wrapperFor(txn);
    if (!db_.isOpen()) {
        throw StoreError("Cannot fetch records: database not open");
    }
    std::map<Key, Record> found;
    for (const auto& key : keys) {
        std::string skey = storageKey(key);
        std::optional<std::string> value;
        bool ok = wrapper ? wrapper->get(skey, value) : db_.get(skey, value);
        if (!ok) {
            throw StoreError("Failed to fetch " + key.debugString() + ": " +
                             (wrapper ? wrapper->lastError() : db_.lastError()));
        }
        if (value) {
            found.emplace(key, decodeRecord(skey, *value));
        }
    }
    return found;
}

void RocksDBStore::remove(const std::vector<Key>& keys, StoreTransaction* txn) {
    auto* wrapper = wrapperFor(txn);
    if (wrapper) {
        for (const auto& key : keys) {
            if (!wrapper->del(storageKey(key))) {
                throw StoreError("Failed to delete " + key.debugString() + " in transaction");
            }
        }
        return;
    }
    auto batch = db_.createWriteBatch();
    for (const auto& key : keys) {
        batch->del(storageKey(key));
    }
    if (!batch->commit()) {
        throw StoreError("Failed to delete " + std::to_string(keys.size()) + " records: " + db_.lastError());
    }
    QUARRY_DEBUG("Deleted {} records", keys.size());
}

int64_t RocksDBStore::count(const query::ScanQuery& query, StoreTransaction* txn) {
    auto keysOnly = query;
    keysOnly.keysOnly = true;
    keysOnly.sorts.clear();
    auto cursor = scan(keysOnly, query::RangeWindow{}, txn);
    int64_t n = 0;
    while (cursor->next()) {
        ++n;
    }
    return n;
}

} // namespace quarry
