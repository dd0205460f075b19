#include <gtest/gtest.h>

#include "config/engine_config.h"
#include "query/query_executor.h"

#include <filesystem>
#include <fstream>

using namespace quarry;

TEST(EngineConfigTest, DefaultsWithoutQuarrySection) {
    auto cfg = EngineConfig::fromYamlString("other:\n  key: 1\n");
    EXPECT_EQ(cfg.logging.level, "info");
    EXPECT_EQ(cfg.storage.db_path, "./data/quarry");
    EXPECT_TRUE(cfg.storage.enable_wal);
    EXPECT_FALSE(cfg.query.exclude_ancestor_queries_from_txn);
    EXPECT_FALSE(cfg.tracing.enabled);
}

TEST(EngineConfigTest, ParsesYamlSections) {
    auto cfg = EngineConfig::fromYamlString(R"(
quarry:
  logging:
    level: debug
    file: ""
  storage:
    db_path: /tmp/quarry-test
    memtable_size_mb: 16
    enable_wal: false
    compression: lz4
  query:
    exclude_ancestor_queries_from_txn: true
    accurate_delete: true
  tracing:
    enabled: true
    service_name: quarry-test
)");
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.file, "");
    EXPECT_EQ(cfg.storage.db_path, "/tmp/quarry-test");
    EXPECT_EQ(cfg.storage.memtable_size_mb, 16u);
    EXPECT_EQ(cfg.storage.block_cache_size_mb, 256u);
    EXPECT_FALSE(cfg.storage.enable_wal);
    EXPECT_EQ(cfg.storage.compression, "lz4");
    EXPECT_TRUE(cfg.query.exclude_ancestor_queries_from_txn);
    EXPECT_TRUE(cfg.query.accurate_delete);
    EXPECT_TRUE(cfg.tracing.enabled);
    EXPECT_EQ(cfg.tracing.service_name, "quarry-test");
    EXPECT_EQ(cfg.tracing.endpoint, "http://localhost:4318");
}

TEST(EngineConfigTest, MalformedYamlFallsBackToDefaults) {
    auto cfg = EngineConfig::fromYamlString("quarry: [unclosed");
    EXPECT_EQ(cfg.storage.db_path, "./data/quarry");
}

TEST(EngineConfigTest, MissingFileFallsBackToDefaults) {
    auto cfg = EngineConfig::loadFromYaml("/nonexistent/quarry.yaml");
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST(EngineConfigTest, LoadsFromFile) {
    auto path = std::filesystem::temp_directory_path() / "quarry_engine_config_test.yaml";
    {
        std::ofstream out(path);
        out << "quarry:\n  storage:\n    db_path: /var/lib/quarry\n";
    }
    auto cfg = EngineConfig::loadFromYaml(path.string());
    EXPECT_EQ(cfg.storage.db_path, "/var/lib/quarry");
    std::filesystem::remove(path);
}

TEST(EngineConfigTest, JsonRoundTrip) {
    EngineConfig cfg;
    cfg.storage.db_path = "/data/q";
    cfg.query.accurate_delete = true;
    cfg.tracing.service_name = "svc";

    auto restored = EngineConfig::fromJson(cfg.toJson());
    EXPECT_EQ(restored.storage.db_path, "/data/q");
    EXPECT_TRUE(restored.query.accurate_delete);
    EXPECT_EQ(restored.tracing.service_name, "svc");
    EXPECT_EQ(restored.toJson(), cfg.toJson());
}

TEST(EngineConfigTest, PartialJsonKeepsDefaults) {
    auto cfg = EngineConfig::fromJson(json{{"storage", {{"wal_dir", "/wal"}}}});
    EXPECT_EQ(cfg.storage.wal_dir, "/wal");
    EXPECT_EQ(cfg.storage.db_path, "./data/quarry");
}

TEST(EngineConfigTest, MapsToRocksDBConfig) {
    EngineConfig cfg;
    cfg.storage.db_path = "/data/q";
    cfg.storage.block_cache_size_mb = 32;
    cfg.storage.enable_wal = false;
    auto rocks = cfg.rocksdbConfig();
    EXPECT_EQ(rocks.db_path, "/data/q");
    EXPECT_EQ(rocks.block_cache_size_mb, 32u);
    EXPECT_FALSE(rocks.enable_wal);
}

TEST(EngineConfigTest, ExecutorOptionsFollowQuerySection) {
    EngineConfig cfg;
    cfg.query.exclude_ancestor_queries_from_txn = true;
    auto options = query::ExecutorOptions::fromConfig(cfg);
    EXPECT_TRUE(options.excludeAncestorQueriesFromTxn);
    EXPECT_FALSE(options.accurateDelete);
}
