#pragma once

#include "query/native_query.h"
#include "query/range_window.h"
#include "storage/key.h"
#include "storage/record.h"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace quarry {

/// Failure reported by a store implementation.
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Forward-only, lazily evaluated sequence of records.
class RecordCursor {
public:
    virtual ~RecordCursor() = default;

    /// Next record, or nullopt once exhausted. May throw StoreError.
    virtual std::optional<Record> next() = 0;
};

/// Cursor over records that are already in memory.
class VectorRecordCursor : public RecordCursor {
public:
    explicit VectorRecordCursor(std::vector<Record> records) : records_(std::move(records)) {}

    std::optional<Record> next() override {
        if (pos_ >= records_.size()) return std::nullopt;
        return std::move(records_[pos_++]);
    }

private:
    std::vector<Record> records_;
    size_t pos_ = 0;
};

/// Store-side transaction handle. Ownership stays with the store.
class StoreTransaction {
public:
    virtual ~StoreTransaction() = default;
    virtual bool isActive() const = 0;
};

/**
 * Operations the query executor needs from a store. A null transaction
 * means the call runs outside any transaction.
 */
class StoreClient {
public:
    virtual ~StoreClient() = default;

    virtual std::unique_ptr<RecordCursor> scan(const query::ScanQuery& query,
                                               const query::RangeWindow& window,
                                               StoreTransaction* txn) = 0;

    /// Records for the keys that exist; missing keys are absent from the map.
    virtual std::map<Key, Record> get(const std::vector<Key>& keys, StoreTransaction* txn) = 0;

    virtual void remove(const std::vector<Key>& keys, StoreTransaction* txn) = 0;

    virtual int64_t count(const query::ScanQuery& query, StoreTransaction* txn) = 0;

    /// Transaction active on the calling context, or nullptr.
    virtual StoreTransaction* currentTransaction() = 0;
};

} // namespace quarry
