// File: tests/config/engine_config_test.cpp
//
// Tests for YAML configuration system

#include "config/engine_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>

namespace engram {
namespace {

class EngineConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path =
        (std::filesystem::temp_directory_path() / "engram_test_config.yaml").string();

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(EngineConfigTest, DefaultConfig) {
    auto config = EngineConfig::Default();

    EXPECT_EQ("inverse_square", config.scoring.decay_model);
    EXPECT_DOUBLE_EQ(1.0, config.scoring.working.half_life_days);
    EXPECT_EQ(500u, config.consolidation.batch_size);
    EXPECT_EQ(5u, config.consolidation.max_parallelism);
    EXPECT_FLOAT_EQ(60.0f, config.retrieval.rrf_k);
    EXPECT_EQ("memory", config.storage.backend);
    EXPECT_FALSE(config.logging.debug);
    EXPECT_TRUE(config.Validate());
}

TEST_F(EngineConfigTest, LoadFromString) {
    std::string yaml = R"(
working_tier:
  half_life_days: 2.5
  min_dwell_seconds: 600
  promote_importance: 0.7
  promote_access: 3

scoring:
  decay_model: "exponential"
  archival_floor: 0.1
  recency_window_seconds: 7200

dedup:
  similarity_threshold: 0.9

retrieval:
  per_signal_k: 25
  graph_weight: 0.5
  enable_graph: false
  max_graph_depth: 3
  poll_interval_ms: 2

consolidation:
  interval_ms: 60000
  batch_size: 100
  enable_merge: no

llm:
  dimension: 128
  call_timeout_ms: 2500

ingest:
  embed_on_ingest: true
  default_importance: 0.4
  summarize_min_chars: 200

storage:
  backend: "sqlite"
  db_path: "memories.db"
  synchronous: "FULL"

logging:
  debug: true
)";

    auto config_opt = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());
    auto config = config_opt.value();

    EXPECT_DOUBLE_EQ(2.5, config.scoring.working.half_life_days);
    EXPECT_EQ(600, config.scoring.working.min_dwell.count());
    EXPECT_FLOAT_EQ(0.7f, config.scoring.working.promote_importance_threshold);
    EXPECT_EQ(3u, config.scoring.working.promote_access_threshold);
    EXPECT_DOUBLE_EQ(15.0, config.scoring.short_term.half_life_days);

    EXPECT_EQ("exponential", config.scoring.decay_model);
    EXPECT_FLOAT_EQ(0.1f, config.scoring.archival_floor);
    EXPECT_EQ(7200, config.scoring.recency_window.count());
    EXPECT_FLOAT_EQ(0.9f, config.dedup.similarity_threshold);

    EXPECT_EQ(25u, config.retrieval.per_signal_k);
    EXPECT_FLOAT_EQ(0.5f, config.retrieval.graph_weight);
    EXPECT_FALSE(config.retrieval.enable_graph);
    EXPECT_EQ(3u, config.retrieval.max_graph_depth);
    EXPECT_EQ(2, config.retrieval.poll_interval.count());

    EXPECT_EQ(60000, config.consolidation.interval.count());
    EXPECT_EQ(100u, config.consolidation.batch_size);
    EXPECT_FALSE(config.consolidation.enable_merge);

    EXPECT_EQ(128u, config.llm.dimension);
    EXPECT_EQ(2500u, config.llm.call_timeout_ms);

    EXPECT_TRUE(config.ingest.embed_on_ingest);
    EXPECT_FLOAT_EQ(0.4f, config.ingest.default_importance);

    EXPECT_EQ("sqlite", config.storage.backend);
    EXPECT_EQ("memories.db", config.storage.db_path);
    EXPECT_EQ("FULL", config.storage.synchronous);
    EXPECT_TRUE(config.logging.debug);
}

TEST_F(EngineConfigTest, SaveAndLoad) {
    auto config = EngineConfig::Default();
    config.scoring.short_term.half_life_days = 20.0;
    config.retrieval.keyword_weight = 2.0f;
    config.consolidation.retry_budget = 7;
    config.storage.db_path = "saved.db";
    config.logging.quiet = true;

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded = EngineConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_DOUBLE_EQ(20.0, loaded->scoring.short_term.half_life_days);
    EXPECT_FLOAT_EQ(2.0f, loaded->retrieval.keyword_weight);
    EXPECT_EQ(7u, loaded->consolidation.retry_budget);
    EXPECT_EQ("saved.db", loaded->storage.db_path);
    EXPECT_TRUE(loaded->logging.quiet);
}

TEST_F(EngineConfigTest, LoadMissingFile) {
    EXPECT_FALSE(EngineConfig::LoadFromFile("/nonexistent/engram.yaml").has_value());
}

TEST_F(EngineConfigTest, MalformedYamlFails) {
    EXPECT_FALSE(EngineConfig::LoadFromString("scoring: [unclosed").has_value());
}

TEST_F(EngineConfigTest, BadValuesFail) {
    EXPECT_FALSE(EngineConfig::LoadFromString("consolidation:\n  batch_size: lots\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("retrieval:\n  enable_vector: maybe\n").has_value());
}

TEST_F(EngineConfigTest, NonFiniteNumbersFail) {
    EXPECT_FALSE(EngineConfig::LoadFromString("retrieval:\n  rrf_k: nan\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("retrieval:\n  graph_weight: inf\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("scoring:\n  archival_floor: NaN\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("working_tier:\n  half_life_days: nan\n").has_value());

    auto config = EngineConfig::Default();
    config.retrieval.keyword_weight = std::numeric_limits<float>::quiet_NaN();
    config.dedup.similarity_threshold = std::numeric_limits<float>::quiet_NaN();
    config.ingest.default_importance = std::numeric_limits<float>::quiet_NaN();
    EXPECT_EQ(3u, config.GetValidationErrors().size());
}

TEST_F(EngineConfigTest, NegativeCountsFail) {
    EXPECT_FALSE(EngineConfig::LoadFromString("consolidation:\n  batch_size: -5\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("llm:\n  cache_capacity: \" -1\"\n").has_value());
}

TEST_F(EngineConfigTest, SignalSlotsLoadAndValidate) {
    auto config = EngineConfig::LoadFromString("retrieval:\n  max_concurrent_signals: 3\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(3u, config->retrieval.max_concurrent_signals);
    EXPECT_NE(std::string::npos, config->ToYamlString().find("max_concurrent_signals: 3"));

    EXPECT_FALSE(EngineConfig::LoadFromString("retrieval:\n  max_concurrent_signals: 0\n").has_value());
}

TEST_F(EngineConfigTest, GroupConsolidationSettingsLoad) {
    auto config = EngineConfig::LoadFromString(
        "consolidation:\n"
        "  max_keyword_tags: 3\n"
        "  enable_group_consolidation: false\n"
        "  group_trigger_size: 40\n"
        "  group_similarity_threshold: 0.7\n"
        "ingest:\n"
        "  group_summary_importance: 0.6\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(3u, config->consolidation.max_keyword_tags);
    EXPECT_FALSE(config->consolidation.enable_group_consolidation);
    EXPECT_EQ(40u, config->consolidation.group_trigger_size);
    EXPECT_FLOAT_EQ(0.7f, config->consolidation.group_similarity_threshold);
    EXPECT_FLOAT_EQ(0.6f, config->ToCoordinatorConfig().group_summary_importance);

    EXPECT_FALSE(EngineConfig::LoadFromString("consolidation:\n  group_max_size: 1\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("consolidation:\n  group_similarity_threshold: 1.5\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("ingest:\n  group_summary_importance: nan\n").has_value());
}

TEST_F(EngineConfigTest, InvalidValuesFailValidation) {
    EXPECT_FALSE(EngineConfig::LoadFromString("retrieval:\n  max_graph_depth: 9\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("storage:\n  backend: \"redis\"\n").has_value());
    EXPECT_FALSE(EngineConfig::LoadFromString("working_tier:\n  half_life_days: 0\n").has_value());
}

TEST_F(EngineConfigTest, UnknownKeysAreIgnored) {
    auto config = EngineConfig::LoadFromString("scoring:\n  colour: blue\n  archival_floor: 0.2\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_FLOAT_EQ(0.2f, config->scoring.archival_floor);
}

TEST_F(EngineConfigTest, ValidationErrors) {
    auto config = EngineConfig::Default();
    config.retrieval.enable_vector = false;
    config.retrieval.enable_keyword = false;
    config.retrieval.enable_graph = false;
    config.ingest.default_importance = 1.5f;

    EXPECT_FALSE(config.Validate());
    EXPECT_EQ(2u, config.GetValidationErrors().size());
}

TEST_F(EngineConfigTest, ComponentConfigs) {
    auto config = EngineConfig::Default();
    config.ingest.summarize_min_chars = 42;
    config.ingest.record_access_on_search = false;
    config.llm.dimension = 64;
    config.llm.retry_max_attempts = 5;
    config.storage.busy_timeout_ms = 250;

    auto coordinator = config.ToCoordinatorConfig();
    EXPECT_EQ(42u, coordinator.consolidation.summarize_min_chars);
    EXPECT_FALSE(coordinator.record_access_on_search);
    EXPECT_EQ(64u, coordinator.embedding_dimension);
    EXPECT_TRUE(coordinator.IsValid());

    EXPECT_EQ(64u, config.ToHashingModelConfig().dimension);
    EXPECT_EQ(5, config.ToCachedModelConfig().retry.max_attempts);
    EXPECT_TRUE(config.ToCachedModelConfig().IsValid());
    EXPECT_EQ(250, config.ToPersistentConfig().busy_timeout_ms);
}

} // namespace
} // namespace engram
