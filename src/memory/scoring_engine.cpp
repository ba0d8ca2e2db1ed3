// File: src/memory/scoring_engine.cpp
//
// Implementation of Scoring Engine

#include "memory/scoring_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace engram {

namespace {

bool InUnitRange(float value) {
    return std::isfinite(value) && value >= 0.0f && value <= 1.0f;
}

} // namespace

// ============================================================================
// ScoringEngine::Config
// ============================================================================

const TierPolicy& ScoringEngine::Config::PolicyFor(MemoryTier tier) const {
    switch (tier) {
        case MemoryTier::WORKING: return working;
        case MemoryTier::SHORT_TERM: return short_term;
        case MemoryTier::LONG_TERM: return long_term;
    }
    throw InvalidRecordState("Unrecognized tier " + std::to_string(static_cast<int>(tier)));
}

TierPolicy& ScoringEngine::Config::PolicyFor(MemoryTier tier) {
    return const_cast<TierPolicy&>(static_cast<const Config&>(*this).PolicyFor(tier));
}

std::vector<std::string> ScoringEngine::Config::GetValidationErrors() const {
    std::vector<std::string> errors;

    for (MemoryTier tier : AllTiers()) {
        const TierPolicy& policy = PolicyFor(tier);
        std::string name = ToString(tier);
        if (!std::isfinite(policy.half_life_days) || policy.half_life_days <= 0.0) {
            errors.push_back(name + ": half_life_days must be positive");
        }
        if (policy.min_dwell.count() < 0) {
            errors.push_back(name + ": min_dwell cannot be negative");
        }
        if (!InUnitRange(policy.promote_importance_threshold)) {
            errors.push_back(name + ": promote_importance_threshold must be in [0, 1]");
        }
    }

    if (decay_model != "inverse_square" && decay_model != "exponential") {
        errors.push_back("decay_model must be 'inverse_square' or 'exponential'");
    }
    if (!std::isfinite(archival_floor) || archival_floor < 0.0f) {
        errors.push_back("archival_floor must be a non-negative number");
    }
    if (!InUnitRange(archival_importance_ceiling)) {
        errors.push_back("archival_importance_ceiling must be in [0, 1]");
    }
    if (recency_window.count() < 0) {
        errors.push_back("recency_window cannot be negative");
    }

    return errors;
}

bool ScoringEngine::Config::IsValid() const {
    return GetValidationErrors().empty();
}

// ============================================================================
// ScoringEngine
// ============================================================================

ScoringEngine::ScoringEngine()
    : ScoringEngine(Config{}) {}

ScoringEngine::ScoringEngine(const Config& config)
    : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid ScoringEngine configuration: " +
                                    config_.GetValidationErrors().front());
    }
    BuildDecayFunctions();
}

ScoringEngine::ScoringEngine(const ScoringEngine& other)
    : config_(other.config_) {
    BuildDecayFunctions();
}

ScoringEngine& ScoringEngine::operator=(const ScoringEngine& other) {
    if (this != &other) {
        config_ = other.config_;
        BuildDecayFunctions();
    }
    return *this;
}

void ScoringEngine::BuildDecayFunctions() {
    for (MemoryTier tier : AllTiers()) {
        decay_[static_cast<size_t>(tier)] =
            CreateDecayFunction(config_.decay_model, config_.PolicyFor(tier).half_life_days);
    }
}

const IDecayFunction& ScoringEngine::DecayFor(MemoryTier tier) const {
    auto index = static_cast<size_t>(tier);
    if (index >= decay_.size() || !decay_[index]) {
        throw InvalidRecordState("Unrecognized tier " + std::to_string(index));
    }
    return *decay_[index];
}

Timestamp::Duration ScoringEngine::CheckedAge(const MemoryRecord& record, Timestamp now) {
    auto age = now - record.GetCreatedAt();
    if (age.count() < 0) {
        throw InvalidRecordState("Record " + record.GetID().value() +
                                 " was created after the scoring time (clock skew)");
    }
    return age;
}

float ScoringEngine::DecayWeight(float importance, MemoryTier tier, Timestamp::Duration age) const {
    if (age.count() < 0) {
        throw InvalidRecordState("Negative age passed to DecayWeight");
    }
    return DecayFor(tier).ApplyDecay(std::clamp(importance, 0.0f, 1.0f), age);
}

ScoreResult ScoringEngine::Score(const MemoryRecord& record, Timestamp now) const {
    auto age = CheckedAge(record, now);

    ScoreResult result;
    result.importance = std::clamp(record.GetImportance(), 0.0f, 1.0f);
    result.decay_weight = DecayWeight(result.importance, record.GetTier(), age);
    return result;
}

bool ScoringEngine::ShouldPromote(const MemoryRecord& record, Timestamp now) const {
    CheckedAge(record, now);

    if (record.IsArchived() || !NextTier(record.GetTier())) {
        return false;
    }

    auto in_tier = now - record.GetTierEnteredAt();
    if (in_tier.count() < 0) {
        throw InvalidRecordState("Record " + record.GetID().value() +
                                 " entered its tier after the scoring time");
    }

    const TierPolicy& policy = config_.PolicyFor(record.GetTier());
    if (in_tier < std::chrono::duration_cast<Timestamp::Duration>(policy.min_dwell)) {
        return false;
    }

    return record.GetImportance() >= policy.promote_importance_threshold ||
           record.GetAccessCount() >= policy.promote_access_threshold;
}

bool ScoringEngine::HasRecencyOverride(const MemoryRecord& record, Timestamp now) const {
    if (record.GetAccessCount() < config_.recency_min_access) {
        return false;
    }
    auto since_access = now - record.GetLastAccessed();
    return since_access < std::chrono::duration_cast<Timestamp::Duration>(config_.recency_window);
}

bool ScoringEngine::ShouldArchive(const MemoryRecord& record, Timestamp now) const {
    if (record.IsArchived()) {
        return false;
    }

    ScoreResult score = Score(record, now);
    if (score.decay_weight >= config_.archival_floor) {
        return false;
    }
    if (score.importance >= config_.archival_importance_ceiling) {
        return false;
    }
    return !HasRecencyOverride(record, now);
}

} // namespace engram
