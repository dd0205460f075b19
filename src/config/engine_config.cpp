#include "config/engine_config.h"
#include "utils/logger.h"

#include <yaml-cpp/yaml.h>

namespace quarry {

namespace {

EngineConfig fromYamlNode(const YAML::Node& root) {
    EngineConfig result;
    auto section = root["quarry"];
    if (!section) {
        return result;
    }

    if (auto logging = section["logging"]) {
        result.logging.level = logging["level"].as<std::string>(result.logging.level);
        result.logging.file = logging["file"].as<std::string>(result.logging.file);
        result.logging.pattern = logging["pattern"].as<std::string>(result.logging.pattern);
    }

    if (auto storage = section["storage"]) {
        result.storage.db_path = storage["db_path"].as<std::string>(result.storage.db_path);
        result.storage.wal_dir = storage["wal_dir"].as<std::string>(result.storage.wal_dir);
        result.storage.memtable_size_mb = storage["memtable_size_mb"].as<size_t>(result.storage.memtable_size_mb);
        result.storage.block_cache_size_mb =
            storage["block_cache_size_mb"].as<size_t>(result.storage.block_cache_size_mb);
        result.storage.enable_wal = storage["enable_wal"].as<bool>(result.storage.enable_wal);
        result.storage.compression = storage["compression"].as<std::string>(result.storage.compression);
    }

    if (auto query = section["query"]) {
        result.query.exclude_ancestor_queries_from_txn =
            query["exclude_ancestor_queries_from_txn"].as<bool>(false);
        result.query.accurate_delete = query["accurate_delete"].as<bool>(false);
    }

    if (auto tracing = section["tracing"]) {
        result.tracing.enabled = tracing["enabled"].as<bool>(false);
        result.tracing.service_name = tracing["service_name"].as<std::string>(result.tracing.service_name);
        result.tracing.endpoint = tracing["endpoint"].as<std::string>(result.tracing.endpoint);
    }
    return result;
}

} // namespace

RocksDBWrapper::Config EngineConfig::rocksdbConfig() const {
    RocksDBWrapper::Config cfg;
    cfg.db_path = storage.db_path;
    cfg.wal_dir = storage.wal_dir;
    cfg.memtable_size_mb = storage.memtable_size_mb;
    cfg.block_cache_size_mb = storage.block_cache_size_mb;
    cfg.enable_wal = storage.enable_wal;
    cfg.compression = storage.compression;
    return cfg;
}

EngineConfig EngineConfig::loadFromYaml(const std::string& yaml_path) {
    try {
        return fromYamlNode(YAML::LoadFile(yaml_path));
    } catch (const YAML::Exception& e) {
        QUARRY_ERROR("Failed to load engine config from {}: {}", yaml_path, e.what());
        return EngineConfig();
    }
}

EngineConfig EngineConfig::fromYamlString(const std::string& yaml) {
    try {
        return fromYamlNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        QUARRY_ERROR("Failed to parse engine config: {}", e.what());
        return EngineConfig();
    }
}

EngineConfig EngineConfig::fromJson(const json& j) {
    EngineConfig result;
    try {
        if (j.contains("logging")) {
            const auto& l = j["logging"];
            result.logging.level = l.value("level", result.logging.level);
            result.logging.file = l.value("file", result.logging.file);
            result.logging.pattern = l.value("pattern", result.logging.pattern);
        }
        if (j.contains("storage")) {
            const auto& s = j["storage"];
            result.storage.db_path = s.value("db_path", result.storage.db_path);
            result.storage.wal_dir = s.value("wal_dir", result.storage.wal_dir);
            result.storage.memtable_size_mb = s.value("memtable_size_mb", result.storage.memtable_size_mb);
            result.storage.block_cache_size_mb = s.value("block_cache_size_mb", result.storage.block_cache_size_mb);
            result.storage.enable_wal = s.value("enable_wal", result.storage.enable_wal);
            result.storage.compression = s.value("compression", result.storage.compression);
        }
        if (j.contains("query")) {
            const auto& q = j["query"];
            result.query.exclude_ancestor_queries_from_txn = q.value("exclude_ancestor_queries_from_txn", false);
            result.query.accurate_delete = q.value("accurate_delete", false);
        }
        if (j.contains("tracing")) {
            const auto& t = j["tracing"];
            result.tracing.enabled = t.value("enabled", false);
            result.tracing.service_name = t.value("service_name", result.tracing.service_name);
            result.tracing.endpoint = t.value("endpoint", result.tracing.endpoint);
        }
    } catch (const json::exception& e) {
        QUARRY_ERROR("Failed to parse engine config JSON: {}", e.what());
    }
    return result;
}

json EngineConfig::toJson() const {
    return {
        {"logging", {
            {"level", logging.level},
            {"file", logging.file},
            {"pattern", logging.pattern}
        }},
        {"storage", {
            {"db_path", storage.db_path},
            {"wal_dir", storage.wal_dir},
            {"memtable_size_mb", storage.memtable_size_mb},
            {"block_cache_size_mb", storage.block_cache_size_mb},
            {"enable_wal", storage.enable_wal},
            {"compression", storage.compression}
        }},
        {"query", {
            {"exclude_ancestor_queries_from_txn", query.exclude_ancestor_queries_from_txn},
            {"accurate_delete", query.accurate_delete}
        }},
        {"tracing", {
            {"enabled", tracing.enabled},
            {"service_name", tracing.service_name},
            {"endpoint", tracing.endpoint}
        }}
    };
}

} // namespace quarry
