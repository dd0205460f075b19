#pragma once

#include "storage/rocksdb_wrapper.h"

#include <nlohmann/json.hpp>

#include <string>

namespace quarry {

using json = nlohmann::json;

/**
 * Engine settings, loaded from the "quarry:" section of a YAML file or from
 * JSON. Keys that are absent keep their defaults.
 */
struct EngineConfig {
    struct LoggingConfig {
        std::string level = "info";
        std::string file = "quarry.log";
        std::string pattern;  // empty: logger default
    } logging;

    struct StorageConfig {
        std::string db_path = "./data/quarry";
        std::string wal_dir;
        size_t memtable_size_mb = 64;
        size_t block_cache_size_mb = 256;
        bool enable_wal = true;
        std::string compression = "none";
    } storage;

    struct QueryConfig {
        // Run ancestor queries outside the caller's transaction
        bool exclude_ancestor_queries_from_txn = false;
        // Re-fetch batch-delete keys and delete only those still present
        bool accurate_delete = false;
    } query;

    struct TracingConfig {
        bool enabled = false;
        std::string service_name = "quarry";
        std::string endpoint = "http://localhost:4318";
    } tracing;

    RocksDBWrapper::Config rocksdbConfig() const;

    /// Returns defaults when the file cannot be read or parsed.
    static EngineConfig loadFromYaml(const std::string& yaml_path);
    static EngineConfig fromYamlString(const std::string& yaml);
    static EngineConfig fromJson(const json& j);
    json toJson() const;
};

} // namespace quarry
