#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace quarry {

namespace {

rocksdb::Slice toSlice(std::string_view v) {
    return rocksdb::Slice(v.data(), v.size());
}

rocksdb::CompressionType compressionFor(const std::string& name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "lz4") return rocksdb::kLZ4Compression;
    if (v == "zstd") return rocksdb::kZSTD;
    if (v == "snappy") return rocksdb::kSnappyCompression;
    if (v == "zlib") return rocksdb::kZlibCompression;
    return rocksdb::kNoCompression;
}

} // namespace

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    txn_db_options_ = std::make_unique<rocksdb::TransactionDBOptions>();
    txn_options_ = std::make_unique<rocksdb::TransactionOptions>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = true;
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;
    options_->max_background_jobs = config_.max_background_jobs;
    options_->compression = compressionFor(config_.compression);

    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    if (!config_.wal_dir.empty()) {
        options_->wal_dir = config_.wal_dir;
    }
    write_options_->disableWAL = !config_.enable_wal;

    txn_db_options_->transaction_lock_timeout = config_.lock_timeout_ms;
    txn_db_options_->default_lock_timeout = config_.lock_timeout_ms;
    txn_options_->set_snapshot = true;
}

bool RocksDBWrapper::open() {
    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        last_error_ = "Failed to create DB directory '" + config_.db_path + "': " + ec.message();
        QUARRY_ERROR("{}", last_error_);
        return false;
    }

    rocksdb::TransactionDB* txn_db_ptr = nullptr;
    rocksdb::Status status = rocksdb::TransactionDB::Open(*options_, *txn_db_options_, config_.db_path, &txn_db_ptr);
    if (!status.ok()) {
        last_error_ = "Failed to open RocksDB TransactionDB: " + status.ToString();
        QUARRY_ERROR("{}", last_error_);
        return false;
    }

    db_.reset(txn_db_ptr);
    QUARRY_INFO("Opened RocksDB TransactionDB at {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        QUARRY_DEBUG("Closing RocksDB at {}", config_.db_path);
        db_.reset();
    }
}

bool RocksDBWrapper::isOpen() const {
    return db_ != nullptr;
}

bool RocksDBWrapper::get(std::string_view key, std::optional<std::string>& value) {
    value.reset();
    if (!db_) {
        last_error_ = "database not open";
        return false;
    }
    std::string buffer;
    rocksdb::Status status = db_->Get(*read_options_, toSlice(key), &buffer);
    if (status.ok()) {
        value = std::move(buffer);
        return true;
    }
    if (status.IsNotFound()) {
        return true;
    }
    last_error_ = status.ToString();
    QUARRY_ERROR("RocksDB get failed: {}", last_error_);
    return false;
}

bool RocksDBWrapper::put(std::string_view key, std::string_view value) {
    if (!db_) return false;
    rocksdb::Status status = db_->Put(*write_options_, toSlice(key), toSlice(value));
    if (!status.ok()) last_error_ = status.ToString();
    return status.ok();
}

bool RocksDBWrapper::del(std::string_view key) {
    if (!db_) return false;
    rocksdb::Status status = db_->Delete(*write_options_, toSlice(key));
    if (!status.ok()) last_error_ = status.ToString();
    return status.ok();
}

std::unique_ptr<rocksdb::Iterator> RocksDBWrapper::newIterator() {
    if (!db_) return nullptr;
    return std::unique_ptr<rocksdb::Iterator>(db_->NewIterator(*read_options_));
}

bool RocksDBWrapper::commitBatch(rocksdb::WriteBatch* batch) {
    if (!db_) return false;
    rocksdb::Status status = db_->Write(*write_options_, batch);
    if (!status.ok()) last_error_ = status.ToString();
    return status.ok();
}

// WriteBatchWrapper

RocksDBWrapper::WriteBatchWrapper::WriteBatchWrapper(RocksDBWrapper* db)
    : db_(db), batch_(std::make_unique<rocksdb::WriteBatch>()) {}

RocksDBWrapper::WriteBatchWrapper::~WriteBatchWrapper() = default;

void RocksDBWrapper::WriteBatchWrapper::put(std::string_view key, std::string_view value) {
    batch_->Put(toSlice(key), toSlice(value));
}

void RocksDBWrapper::WriteBatchWrapper::del(std::string_view key) {
    batch_->Delete(toSlice(key));
}

bool RocksDBWrapper::WriteBatchWrapper::commit() {
    return db_->commitBatch(batch_.get());
}

std::unique_ptr<RocksDBWrapper::WriteBatchWrapper> RocksDBWrapper::createWriteBatch() {
    return std::make_unique<WriteBatchWrapper>(this);
}

// TransactionWrapper

RocksDBWrapper::TransactionWrapper::TransactionWrapper(RocksDBWrapper* db) : db_(db) {
    if (db_->db_) {
        txn_.reset(db_->db_->BeginTransaction(*db_->write_options_, *db_->txn_options_));
    }
    active_ = txn_ != nullptr;
}

RocksDBWrapper::TransactionWrapper::~TransactionWrapper() {
    if (active_ && txn_) {
        QUARRY_WARN("Transaction neither committed nor rolled back; rolling back");
        rollback();
    }
}

bool RocksDBWrapper::TransactionWrapper::get(std::string_view key, std::optional<std::string>& value) {
    value.reset();
    if (!txn_ || !active_) {
        last_error_ = "transaction not active";
        return false;
    }
    rocksdb::ReadOptions read_opts;
    read_opts.snapshot = txn_->GetSnapshot();
    std::string buffer;
    rocksdb::Status status = txn_->Get(read_opts, toSlice(key), &buffer);
    if (status.ok()) {
        value = std::move(buffer);
        return true;
    }
    if (status.IsNotFound()) {
        return true;
    }
    last_error_ = status.ToString();
    QUARRY_ERROR("Transaction get failed: {}", last_error_);
    return false;
}

bool RocksDBWrapper::TransactionWrapper::put(std::string_view key, std::string_view value) {
    if (!txn_ || !active_) return false;
    return txn_->Put(toSlice(key), toSlice(value)).ok();
}

bool RocksDBWrapper::TransactionWrapper::del(std::string_view key) {
    if (!txn_ || !active_) return false;
    return txn_->Delete(toSlice(key)).ok();
}

std::unique_ptr<rocksdb::Iterator> RocksDBWrapper::TransactionWrapper::newIterator() {
    if (!txn_ || !active_) return nullptr;
    rocksdb::ReadOptions read_opts;
    read_opts.snapshot = txn_->GetSnapshot();
    return std::unique_ptr<rocksdb::Iterator>(txn_->GetIterator(read_opts));
}

bool RocksDBWrapper::TransactionWrapper::commit() {
    if (!txn_ || !active_) return false;
    rocksdb::Status status = txn_->Commit();
    active_ = false;
    if (!status.ok()) {
        if (status.IsBusy() || status.IsTimedOut() || status.IsTryAgain()) {
            QUARRY_WARN("Transaction conflict: {}", status.ToString());
        } else {
            QUARRY_ERROR("Transaction commit failed: {}", status.ToString());
        }
        return false;
    }
    return true;
}

void RocksDBWrapper::TransactionWrapper::rollback() {
    if (!txn_ || !active_) return;
    rocksdb::Status status = txn_->Rollback();
    active_ = false;
    if (!status.ok()) {
        QUARRY_ERROR("Transaction rollback failed: {}", status.ToString());
    }
}

std::unique_ptr<RocksDBWrapper::TransactionWrapper> RocksDBWrapper::beginTransaction() {
    return std::make_unique<TransactionWrapper>(this);
}

} // namespace quarry
