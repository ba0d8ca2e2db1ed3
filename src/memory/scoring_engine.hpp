// File: src/memory/scoring_engine.hpp
//
// Scoring Engine for Memory Records
//
// Pure, deterministic functions that turn a record's importance, age and
// access history into its decay weight and its lifecycle eligibility.
//
// Decay (default model):
//   decay_weight = importance / (1 + (age_days / half_life_days[tier])^2)
//
// Promotion:
//   time_in_tier >= min_dwell[tier] AND
//   (importance >= promote_importance[tier] OR access_count >= promote_access[tier])
//
// Archival:
//   decay_weight < archival_floor AND importance < archival_importance_ceiling
//   AND NOT (last access within recency_window AND access_count >= recency_min_access)

#pragma once

#include "core/memory_record.hpp"
#include "core/types.hpp"
#include "memory/decay_functions.hpp"
#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Lifecycle rules for one tier
struct TierPolicy {
    double half_life_days{30.0};                           ///< Decay half-life
    std::chrono::seconds min_dwell{std::chrono::hours(1)}; ///< Minimum time in tier before promotion
    float promote_importance_threshold{0.8f};              ///< Importance path to promotion
    uint32_t promote_access_threshold{5};                  ///< Access-count path to promotion
};

/// Result of scoring one record
struct ScoreResult {
    float importance{0.0f};
    float decay_weight{0.0f};
};

/// Scoring engine for importance, decay and eligibility decisions
class ScoringEngine {
public:
    /// Configuration for scoring
    struct Config {
        TierPolicy working{1.0, std::chrono::minutes(30), 0.8f, 5};
        TierPolicy short_term{15.0, std::chrono::hours(24 * 15), 0.9f, 10};
        TierPolicy long_term{90.0, std::chrono::seconds(0), 1.0f, 0};

        std::string decay_model{"inverse_square"};   ///< "inverse_square" or "exponential"

        float archival_floor{0.05f};                  ///< Decay weight below which archival is considered
        float archival_importance_ceiling{0.3f};      ///< Importance must be below this to archive

        std::chrono::seconds recency_window{std::chrono::hours(1)};  ///< Recent-access protection window
        uint32_t recency_min_access{1};               ///< Accesses needed for the override

        /// Policy for a tier
        const TierPolicy& PolicyFor(MemoryTier tier) const;
        TierPolicy& PolicyFor(MemoryTier tier);

        /// Validate configuration
        bool IsValid() const;

        /// Human-readable list of problems, empty when valid
        std::vector<std::string> GetValidationErrors() const;
    };

    /// Construct with default configuration
    ScoringEngine();

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit ScoringEngine(const Config& config);

    ScoringEngine(const ScoringEngine& other);
    ScoringEngine& operator=(const ScoringEngine& other);

    /// Compute importance and decay weight at `now`
    ///
    /// @throws InvalidRecordState if the record was created after `now`
    ScoreResult Score(const MemoryRecord& record, Timestamp now) const;

    /// Decay weight for an importance and age (used directly by tests and tools)
    float DecayWeight(float importance, MemoryTier tier, Timestamp::Duration age) const;

    /// Check whether a record may move to the next tier
    ///
    /// @throws InvalidRecordState on negative age or time in tier
    bool ShouldPromote(const MemoryRecord& record, Timestamp now) const;

    /// Check whether a record should be archived
    ///
    /// @throws InvalidRecordState on negative age
    bool ShouldArchive(const MemoryRecord& record, Timestamp now) const;

    /// True when the record was used recently enough to be protected from archival
    bool HasRecencyOverride(const MemoryRecord& record, Timestamp now) const;

    /// Get current configuration
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::array<std::unique_ptr<IDecayFunction>, 3> decay_;

    void BuildDecayFunctions();
    const IDecayFunction& DecayFor(MemoryTier tier) const;
    static Timestamp::Duration CheckedAge(const MemoryRecord& record, Timestamp now);
};

} // namespace engram
