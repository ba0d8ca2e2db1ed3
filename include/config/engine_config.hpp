// File: include/config/engine_config.hpp
//
// YAML Configuration Support for the Engram engine
// Loads every component's settings from one YAML file

#ifndef ENGRAM_ENGINE_CONFIG_HPP
#define ENGRAM_ENGINE_CONFIG_HPP

#include "lifecycle/lifecycle_coordinator.hpp"
#include "llm/cached_language_model.hpp"
#include "llm/hashing_language_model.hpp"
#include "memory/consolidation_scheduler.hpp"
#include "memory/deduplication_engine.hpp"
#include "memory/scoring_engine.hpp"
#include "retrieval/hybrid_retriever.hpp"
#include "storage/persistent_backend.hpp"
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Configuration structure for the whole engine
///
/// Sections map one-to-one onto YAML top-level keys:
///   working_tier, short_term_tier, long_term_tier, scoring, dedup,
///   retrieval, consolidation, llm, ingest, storage, logging
struct EngineConfig {
    // === Lifecycle rules (tier policies live in scoring) ===
    ScoringEngine::Config scoring;

    // === Duplicate detection ===
    DeduplicationEngine::Config dedup;

    // === Search ===
    HybridRetriever::Config retrieval;

    // === Background consolidation ===
    ConsolidationScheduler::Config consolidation;

    // === Language model ===
    struct LLM {
        size_t dimension = 256;
        size_t summary_max_chars = 280;
        size_t cache_capacity = 1024;
        size_t max_concurrent_calls = 4;
        size_t call_timeout_ms = 10000;
        int retry_max_attempts = 3;
        size_t retry_initial_delay_ms = 50;
        size_t retry_max_delay_ms = 2000;
    } llm;

    // === Ingest ===
    struct Ingest {
        bool embed_on_ingest = false;
        float default_importance = 0.5f;
        float group_summary_importance = 0.8f;  // Summary of a consolidated group
        size_t max_content_bytes = 1 << 20;
        size_t summarize_min_chars = 500;
        bool record_access_on_search = true;
    } ingest;

    // === Storage ===
    struct Storage {
        std::string backend = "memory";     // "memory" or "sqlite"
        std::string db_path = "engram.db";
        bool enable_wal = true;
        size_t cache_size_kb = 10240;
        std::string synchronous = "NORMAL";
        int busy_timeout_ms = 5000;
    } storage;

    // === Logging ===
    struct Logging {
        bool debug = false;
        bool quiet = false;   // Silence warnings and errors as well
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// YAML representation of configuration
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// Create default configuration
    static EngineConfig Default();

    // Component configurations
    LifecycleCoordinator::Config ToCoordinatorConfig() const;
    CachedLanguageModel::Config ToCachedModelConfig() const;
    HashingLanguageModel::Config ToHashingModelConfig() const;
    PersistentBackend::Config ToPersistentConfig() const;
};

} // namespace engram

#endif // ENGRAM_ENGINE_CONFIG_HPP
