#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rocksdb {
    class TransactionDB;
    class Transaction;
    class WriteBatch;
    class Iterator;
    class Options;
    class ReadOptions;
    class WriteOptions;
    class TransactionDBOptions;
    class TransactionOptions;
}

namespace quarry {

/// Owner of a RocksDB TransactionDB plus its option set.
class RocksDBWrapper {
public:
    struct Config {
        std::string db_path = "./data/quarry";
        std::string wal_dir;  // empty: inside db_path
        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        int bloom_bits_per_key = 10;
        bool enable_wal = true;
        int max_background_jobs = 2;
        // "none", "lz4", "zstd", "snappy", "zlib"
        std::string compression = "none";
        int lock_timeout_ms = 1000;
    };

    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();

    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;

    bool open();
    void close();
    bool isOpen() const;

    // False on a read failure (see lastError()); `value` is empty when the key is absent
    bool get(std::string_view key, std::optional<std::string>& value);
    bool put(std::string_view key, std::string_view value);
    bool del(std::string_view key);

    /// Atomic group of writes applied by commit().
    class WriteBatchWrapper {
    public:
        explicit WriteBatchWrapper(RocksDBWrapper* db);
        ~WriteBatchWrapper();

        void put(std::string_view key, std::string_view value);
        void del(std::string_view key);
        bool commit();

    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::WriteBatch> batch_;
    };

    std::unique_ptr<WriteBatchWrapper> createWriteBatch();

    /// Pessimistic transaction reading from the snapshot taken at begin.
    /// Rolled back on destruction unless committed.
    class TransactionWrapper {
    public:
        explicit TransactionWrapper(RocksDBWrapper* db);
        ~TransactionWrapper();

        bool get(std::string_view key, std::optional<std::string>& value);
        bool put(std::string_view key, std::string_view value);
        bool del(std::string_view key);

        // Sees this transaction's own writes on top of its snapshot
        std::unique_ptr<rocksdb::Iterator> newIterator();

        bool commit();
        void rollback();
        bool isActive() const { return active_; }
        const std::string& lastError() const { return last_error_; }

    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::Transaction> txn_;
        std::string last_error_;
        bool active_ = true;
    };

    std::unique_ptr<TransactionWrapper> beginTransaction();

    std::unique_ptr<rocksdb::Iterator> newIterator();

    const Config& getConfig() const { return config_; }
    const std::string& lastError() const { return last_error_; }

private:
    void configureOptions();
    bool commitBatch(rocksdb::WriteBatch* batch);

    Config config_;
    std::string last_error_;
    std::unique_ptr<rocksdb::TransactionDB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::TransactionDBOptions> txn_db_options_;
    std::unique_ptr<rocksdb::TransactionOptions> txn_options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;
};

} // namespace quarry
