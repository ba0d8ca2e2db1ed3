// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the Engram engine

#include "config/engine_config.hpp"
#include "core/debug_log.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace engram {

namespace {

DebugLog& ConfigLog() {
    static DebugLog log("EngineConfig");
    return log;
}

// Helper function to read string from YAML scalar
std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
bool ParseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" ||
        value == "1" || value == "on" || value == "On" || value == "ON") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" ||
        value == "0" || value == "off" || value == "Off" || value == "OFF") {
        return false;
    }
    throw std::invalid_argument("not a boolean: " + value);
}

// std::stof accepts "nan" and "inf"; neither is a usable setting
float ParseFloat(const std::string& value) {
    float parsed = std::stof(value);
    if (!std::isfinite(parsed)) {
        throw std::invalid_argument("not a finite number: " + value);
    }
    return parsed;
}

double ParseDouble(const std::string& value) {
    double parsed = std::stod(value);
    if (!std::isfinite(parsed)) {
        throw std::invalid_argument("not a finite number: " + value);
    }
    return parsed;
}

// std::stoul wraps "-5" around to a huge value instead of failing
unsigned long ParseUnsigned(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("negative value: " + value);
    }
    return std::stoul(value);
}

bool IsFiniteNonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

const char* Bool(bool value) {
    return value ? "true" : "false";
}

bool ApplyTierKey(TierPolicy& policy, const std::string& key, const std::string& value) {
    if (key == "half_life_days") policy.half_life_days = ParseDouble(value);
    else if (key == "min_dwell_seconds") policy.min_dwell = std::chrono::seconds(std::stoll(value));
    else if (key == "promote_importance") policy.promote_importance_threshold = ParseFloat(value);
    else if (key == "promote_access") policy.promote_access_threshold = static_cast<uint32_t>(ParseUnsigned(value));
    else return false;
    return true;
}

// Apply one key of one section; false when the key is unknown
bool ApplyValue(EngineConfig& config, const std::string& section,
                const std::string& key, const std::string& value) {
    if (section == "working_tier") {
        return ApplyTierKey(config.scoring.working, key, value);
    }
    if (section == "short_term_tier") {
        return ApplyTierKey(config.scoring.short_term, key, value);
    }
    if (section == "long_term_tier") {
        return ApplyTierKey(config.scoring.long_term, key, value);
    }
    if (section == "scoring") {
        auto& s = config.scoring;
        if (key == "decay_model") s.decay_model = value;
        else if (key == "archival_floor") s.archival_floor = ParseFloat(value);
        else if (key == "archival_importance_ceiling") s.archival_importance_ceiling = ParseFloat(value);
        else if (key == "recency_window_seconds") s.recency_window = std::chrono::seconds(std::stoll(value));
        else if (key == "recency_min_access") s.recency_min_access = static_cast<uint32_t>(ParseUnsigned(value));
        else return false;
        return true;
    }
    if (section == "dedup") {
        auto& d = config.dedup;
        if (key == "similarity_threshold") d.similarity_threshold = ParseFloat(value);
        else if (key == "candidate_limit") d.candidate_limit = ParseUnsigned(value);
        else if (key == "max_alias_hops") d.max_alias_hops = ParseUnsigned(value);
        else return false;
        return true;
    }
    if (section == "retrieval") {
        auto& r = config.retrieval;
        if (key == "per_signal_k") r.per_signal_k = ParseUnsigned(value);
        else if (key == "rrf_k") r.rrf_k = ParseFloat(value);
        else if (key == "vector_weight") r.vector_weight = ParseFloat(value);
        else if (key == "keyword_weight") r.keyword_weight = ParseFloat(value);
        else if (key == "graph_weight") r.graph_weight = ParseFloat(value);
        else if (key == "enable_vector") r.enable_vector = ParseBool(value);
        else if (key == "enable_keyword") r.enable_keyword = ParseBool(value);
        else if (key == "enable_graph") r.enable_graph = ParseBool(value);
        else if (key == "max_graph_depth") r.max_graph_depth = ParseUnsigned(value);
        else if (key == "default_token_budget") r.default_token_budget = ParseUnsigned(value);
        else if (key == "classify_intent") r.classify_intent = ParseBool(value);
        else if (key == "poll_interval_ms") r.poll_interval = std::chrono::milliseconds(std::stoll(value));
        else if (key == "max_concurrent_signals") r.max_concurrent_signals = ParseUnsigned(value);
        else return false;
        return true;
    }
    if (section == "consolidation") {
        auto& c = config.consolidation;
        if (key == "interval_ms") c.interval = std::chrono::milliseconds(std::stoll(value));
        else if (key == "batch_size") c.batch_size = ParseUnsigned(value);
        else if (key == "max_parallelism") c.max_parallelism = ParseUnsigned(value);
        else if (key == "retry_budget") c.retry_budget = static_cast<uint32_t>(ParseUnsigned(value));
        else if (key == "fill_trigger_threshold") c.fill_trigger_threshold = ParseUnsigned(value);
        else if (key == "job_history_size") c.job_history_size = ParseUnsigned(value);
        else if (key == "enable_merge") c.enable_merge = ParseBool(value);
        else if (key == "max_keyword_tags") c.max_keyword_tags = ParseUnsigned(value);
        else if (key == "keyword_min_chars") c.keyword_min_chars = ParseUnsigned(value);
        else if (key == "enable_group_consolidation") c.enable_group_consolidation = ParseBool(value);
        else if (key == "group_trigger_size") c.group_trigger_size = ParseUnsigned(value);
        else if (key == "group_scan_limit") c.group_scan_limit = ParseUnsigned(value);
        else if (key == "group_similarity_threshold") c.group_similarity_threshold = ParseFloat(value);
        else if (key == "group_max_size") c.group_max_size = ParseUnsigned(value);
        else return false;
        return true;
    }
    if (section == "llm") {
        auto& l = config.llm;
        if (key == "dimension") l.dimension = ParseUnsigned(value);
        else if (key == "summary_max_chars") l.summary_max_chars = ParseUnsigned(value);
        else if (key == "cache_capacity") l.cache_capacity = ParseUnsigned(value);
        else if (key == "max_concurrent_calls") l.max_concurrent_calls = ParseUnsigned(value);
        else if (key == "call_timeout_ms") l.call_timeout_ms = ParseUnsigned(value);
        else if (key == "retry_max_attempts") l.retry_max_attempts = std::stoi(value);
        else if (key == "retry_initial_delay_ms") l.retry_initial_delay_ms = ParseUnsigned(value);
        else if (key == "retry_max_delay_ms") l.retry_max_delay_ms = ParseUnsigned(value);
        else return false;
        return true;
    }
    if (section == "ingest") {
        auto& i = config.ingest;
        if (key == "embed_on_ingest") i.embed_on_ingest = ParseBool(value);
        else if (key == "default_importance") i.default_importance = ParseFloat(value);
        else if (key == "group_summary_importance") i.group_summary_importance = ParseFloat(value);
        else if (key == "max_content_bytes") i.max_content_bytes = ParseUnsigned(value);
        else if (key == "summarize_min_chars") i.summarize_min_chars = ParseUnsigned(value);
        else if (key == "record_access_on_search") i.record_access_on_search = ParseBool(value);
        else return false;
        return true;
    }
    if (section == "storage") {
        auto& s = config.storage;
        if (key == "backend") s.backend = value;
        else if (key == "db_path") s.db_path = value;
        else if (key == "enable_wal") s.enable_wal = ParseBool(value);
        else if (key == "cache_size_kb") s.cache_size_kb = ParseUnsigned(value);
        else if (key == "synchronous") s.synchronous = value;
        else if (key == "busy_timeout_ms") s.busy_timeout_ms = std::stoi(value);
        else return false;
        return true;
    }
    if (section == "logging") {
        if (key == "debug") config.logging.debug = ParseBool(value);
        else if (key == "quiet") config.logging.quiet = ParseBool(value);
        else return false;
        return true;
    }
    return false;
}

void WriteTier(std::ostringstream& ss, const char* name, const TierPolicy& policy) {
    ss << name << ":\n";
    ss << "  half_life_days: " << policy.half_life_days << "\n";
    ss << "  min_dwell_seconds: " << policy.min_dwell.count() << "\n";
    ss << "  promote_importance: " << policy.promote_importance_threshold << "\n";
    ss << "  promote_access: " << policy.promote_access_threshold << "\n\n";
}

} // namespace

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        ConfigLog().Error("Failed to open config file: " + filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        ConfigLog().Error("Failed to initialize YAML parser");
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;
    bool failed = false;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            ConfigLog().Error(std::string("YAML parse error: ") +
                              (parser.problem ? parser.problem : "unknown") +
                              " at line " + std::to_string(parser.problem_mark.line + 1));
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name)
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            if (!ApplyValue(config, current_section, current_key, value)) {
                                ConfigLog().Warning("Ignoring unknown key " + current_section +
                                                    "." + current_key);
                            }
                        } catch (const std::exception& e) {
                            ConfigLog().Error("Invalid value '" + value + "' for " + current_section +
                                              "." + current_key + ": " + e.what());
                            failed = true;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        ConfigLog().Error("Configuration validation failed:");
        for (const auto& error : config.GetValidationErrors()) {
            ConfigLog().Error("  - " + error);
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        ConfigLog().Error("Failed to open file for writing: " + filepath);
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# Engram Engine Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    WriteTier(ss, "working_tier", scoring.working);
    WriteTier(ss, "short_term_tier", scoring.short_term);
    WriteTier(ss, "long_term_tier", scoring.long_term);

    ss << "scoring:\n";
    ss << "  decay_model: \"" << scoring.decay_model << "\"\n";
    ss << "  archival_floor: " << scoring.archival_floor << "\n";
    ss << "  archival_importance_ceiling: " << scoring.archival_importance_ceiling << "\n";
    ss << "  recency_window_seconds: " << scoring.recency_window.count() << "\n";
    ss << "  recency_min_access: " << scoring.recency_min_access << "\n\n";

    ss << "dedup:\n";
    ss << "  similarity_threshold: " << dedup.similarity_threshold << "\n";
    ss << "  candidate_limit: " << dedup.candidate_limit << "\n";
    ss << "  max_alias_hops: " << dedup.max_alias_hops << "\n\n";

    ss << "retrieval:\n";
    ss << "  per_signal_k: " << retrieval.per_signal_k << "\n";
    ss << "  rrf_k: " << retrieval.rrf_k << "\n";
    ss << "  vector_weight: " << retrieval.vector_weight << "\n";
    ss << "  keyword_weight: " << retrieval.keyword_weight << "\n";
    ss << "  graph_weight: " << retrieval.graph_weight << "\n";
    ss << "  enable_vector: " << Bool(retrieval.enable_vector) << "\n";
    ss << "  enable_keyword: " << Bool(retrieval.enable_keyword) << "\n";
    ss << "  enable_graph: " << Bool(retrieval.enable_graph) << "\n";
    ss << "  max_graph_depth: " << retrieval.max_graph_depth << "\n";
    ss << "  default_token_budget: " << retrieval.default_token_budget << "\n";
    ss << "  classify_intent: " << Bool(retrieval.classify_intent) << "\n";
    ss << "  poll_interval_ms: " << retrieval.poll_interval.count() << "\n";
    ss << "  max_concurrent_signals: " << retrieval.max_concurrent_signals << "\n\n";

    ss << "consolidation:\n";
    ss << "  interval_ms: " << consolidation.interval.count() << "\n";
    ss << "  batch_size: " << consolidation.batch_size << "\n";
    ss << "  max_parallelism: " << consolidation.max_parallelism << "\n";
    ss << "  retry_budget: " << consolidation.retry_budget << "\n";
    ss << "  fill_trigger_threshold: " << consolidation.fill_trigger_threshold << "\n";
    ss << "  job_history_size: " << consolidation.job_history_size << "\n";
    ss << "  enable_merge: " << Bool(consolidation.enable_merge) << "\n";
    ss << "  max_keyword_tags: " << consolidation.max_keyword_tags << "\n";
    ss << "  keyword_min_chars: " << consolidation.keyword_min_chars << "\n";
    ss << "  enable_group_consolidation: " << Bool(consolidation.enable_group_consolidation) << "\n";
    ss << "  group_trigger_size: " << consolidation.group_trigger_size << "\n";
    ss << "  group_scan_limit: " << consolidation.group_scan_limit << "\n";
    ss << "  group_similarity_threshold: " << consolidation.group_similarity_threshold << "\n";
    ss << "  group_max_size: " << consolidation.group_max_size << "\n\n";

    ss << "llm:\n";
    ss << "  dimension: " << llm.dimension << "\n";
    ss << "  summary_max_chars: " << llm.summary_max_chars << "\n";
    ss << "  cache_capacity: " << llm.cache_capacity << "\n";
    ss << "  max_concurrent_calls: " << llm.max_concurrent_calls << "\n";
    ss << "  call_timeout_ms: " << llm.call_timeout_ms << "\n";
    ss << "  retry_max_attempts: " << llm.retry_max_attempts << "\n";
    ss << "  retry_initial_delay_ms: " << llm.retry_initial_delay_ms << "\n";
    ss << "  retry_max_delay_ms: " << llm.retry_max_delay_ms << "\n\n";

    ss << "ingest:\n";
    ss << "  embed_on_ingest: " << Bool(ingest.embed_on_ingest) << "\n";
    ss << "  default_importance: " << ingest.default_importance << "\n";
    ss << "  group_summary_importance: " << ingest.group_summary_importance << "\n";
    ss << "  max_content_bytes: " << ingest.max_content_bytes << "\n";
    ss << "  summarize_min_chars: " << ingest.summarize_min_chars << "\n";
    ss << "  record_access_on_search: " << Bool(ingest.record_access_on_search) << "\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n";
    ss << "  enable_wal: " << Bool(storage.enable_wal) << "\n";
    ss << "  cache_size_kb: " << storage.cache_size_kb << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n";
    ss << "  busy_timeout_ms: " << storage.busy_timeout_ms << "\n\n";

    ss << "logging:\n";
    ss << "  debug: " << Bool(logging.debug) << "\n";
    ss << "  quiet: " << Bool(logging.quiet) << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors = scoring.GetValidationErrors();

    // Deduplication
    if (!std::isfinite(dedup.similarity_threshold) ||
        dedup.similarity_threshold <= 0.0f || dedup.similarity_threshold > 1.0f) {
        errors.push_back("dedup similarity_threshold must be in (0, 1]");
    }
    if (dedup.candidate_limit == 0) {
        errors.push_back("dedup candidate_limit must be greater than 0");
    }
    if (dedup.max_alias_hops == 0) {
        errors.push_back("dedup max_alias_hops must be greater than 0");
    }

    // Retrieval
    if (retrieval.per_signal_k == 0) {
        errors.push_back("retrieval per_signal_k must be greater than 0");
    }
    if (!IsFiniteNonNegative(retrieval.rrf_k)) {
        errors.push_back("retrieval rrf_k must be a non-negative number");
    }
    if (!IsFiniteNonNegative(retrieval.vector_weight) ||
        !IsFiniteNonNegative(retrieval.keyword_weight) ||
        !IsFiniteNonNegative(retrieval.graph_weight)) {
        errors.push_back("retrieval signal weights must be non-negative numbers");
    }
    if (!retrieval.enable_vector && !retrieval.enable_keyword && !retrieval.enable_graph) {
        errors.push_back("retrieval needs at least one enabled signal");
    }
    if (retrieval.max_graph_depth > GraphExpander::kMaxDepthCap) {
        errors.push_back("retrieval max_graph_depth must be at most " +
                         std::to_string(GraphExpander::kMaxDepthCap));
    }
    if (retrieval.default_token_budget == 0) {
        errors.push_back("retrieval default_token_budget must be greater than 0");
    }
    if (retrieval.poll_interval.count() <= 0) {
        errors.push_back("retrieval poll_interval_ms must be greater than 0");
    }
    if (retrieval.max_concurrent_signals == 0) {
        errors.push_back("retrieval max_concurrent_signals must be greater than 0");
    }

    // Consolidation
    if (consolidation.interval.count() <= 0) {
        errors.push_back("consolidation interval_ms must be greater than 0");
    }
    if (consolidation.batch_size == 0) {
        errors.push_back("consolidation batch_size must be greater than 0");
    }
    if (consolidation.max_parallelism == 0) {
        errors.push_back("consolidation max_parallelism must be greater than 0");
    }
    if (consolidation.retry_budget == 0) {
        errors.push_back("consolidation retry_budget must be greater than 0");
    }
    if (consolidation.fill_trigger_threshold == 0) {
        errors.push_back("consolidation fill_trigger_threshold must be greater than 0");
    }
    if (consolidation.job_history_size == 0) {
        errors.push_back("consolidation job_history_size must be greater than 0");
    }
    if (consolidation.group_trigger_size == 0) {
        errors.push_back("consolidation group_trigger_size must be greater than 0");
    }
    if (consolidation.group_scan_limit < 2 || consolidation.group_max_size < 2) {
        errors.push_back("consolidation group_scan_limit and group_max_size must be at least 2");
    }
    if (!std::isfinite(consolidation.group_similarity_threshold) ||
        consolidation.group_similarity_threshold <= 0.0f ||
        consolidation.group_similarity_threshold > 1.0f) {
        errors.push_back("consolidation group_similarity_threshold must be in (0.0, 1.0]");
    }

    // Language model
    if (llm.dimension == 0) {
        errors.push_back("llm dimension must be greater than 0");
    }
    if (llm.cache_capacity == 0) {
        errors.push_back("llm cache_capacity must be greater than 0");
    }
    if (llm.max_concurrent_calls == 0) {
        errors.push_back("llm max_concurrent_calls must be greater than 0");
    }
    if (llm.call_timeout_ms == 0) {
        errors.push_back("llm call_timeout_ms must be greater than 0");
    }
    if (llm.retry_max_attempts < 1) {
        errors.push_back("llm retry_max_attempts must be at least 1");
    }
    if (llm.retry_max_delay_ms < llm.retry_initial_delay_ms) {
        errors.push_back("llm retry_max_delay_ms must be >= retry_initial_delay_ms");
    }

    // Ingest
    if (!std::isfinite(ingest.default_importance) ||
        ingest.default_importance < 0.0f || ingest.default_importance > 1.0f) {
        errors.push_back("ingest default_importance must be between 0.0 and 1.0");
    }
    if (!std::isfinite(ingest.group_summary_importance) ||
        ingest.group_summary_importance < 0.0f || ingest.group_summary_importance > 1.0f) {
        errors.push_back("ingest group_summary_importance must be between 0.0 and 1.0");
    }
    if (ingest.max_content_bytes == 0) {
        errors.push_back("ingest max_content_bytes must be greater than 0");
    }

    // Storage
    if (storage.backend != "memory" && storage.backend != "sqlite") {
        errors.push_back("storage backend must be one of: memory, sqlite");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("storage db_path is required for the sqlite backend");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("storage synchronous must be one of: FULL, NORMAL, OFF");
    }
    if (storage.busy_timeout_ms < 0) {
        errors.push_back("storage busy_timeout_ms cannot be negative");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

LifecycleCoordinator::Config EngineConfig::ToCoordinatorConfig() const {
    LifecycleCoordinator::Config config;
    config.scoring = scoring;
    config.dedup = dedup;
    config.retrieval = retrieval;
    config.consolidation = consolidation;
    config.consolidation.summarize_min_chars = ingest.summarize_min_chars;
    config.embedding_dimension = llm.dimension;
    config.embed_on_ingest = ingest.embed_on_ingest;
    config.default_importance = ingest.default_importance;
    config.group_summary_importance = ingest.group_summary_importance;
    config.max_content_bytes = ingest.max_content_bytes;
    config.record_access_on_search = ingest.record_access_on_search;
    return config;
}

CachedLanguageModel::Config EngineConfig::ToCachedModelConfig() const {
    CachedLanguageModel::Config config;
    config.cache_capacity = llm.cache_capacity;
    config.max_concurrent_calls = llm.max_concurrent_calls;
    config.call_timeout = std::chrono::milliseconds(llm.call_timeout_ms);
    config.retry.max_attempts = llm.retry_max_attempts;
    config.retry.initial_delay = std::chrono::milliseconds(llm.retry_initial_delay_ms);
    config.retry.max_delay = std::chrono::milliseconds(llm.retry_max_delay_ms);
    return config;
}

HashingLanguageModel::Config EngineConfig::ToHashingModelConfig() const {
    HashingLanguageModel::Config config;
    config.dimension = llm.dimension;
    config.summary_max_chars = llm.summary_max_chars;
    return config;
}

PersistentBackend::Config EngineConfig::ToPersistentConfig() const {
    PersistentBackend::Config config;
    config.db_path = storage.db_path;
    config.enable_wal = storage.enable_wal;
    config.cache_size_kb = storage.cache_size_kb;
    config.synchronous = storage.synchronous;
    config.busy_timeout_ms = storage.busy_timeout_ms;
    return config;
}

} // namespace engram
