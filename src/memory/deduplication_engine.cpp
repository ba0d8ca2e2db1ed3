// File: src/memory/deduplication_engine.cpp
#include "memory/deduplication_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <stdexcept>

namespace engram {

DeduplicationEngine::DeduplicationEngine(std::shared_ptr<MemoryStore> store, const Config& config)
    : store_(std::move(store)), config_(config) {
    if (!store_) {
        throw std::invalid_argument("DeduplicationEngine requires a store");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid DeduplicationEngine configuration");
    }
}

std::optional<RecordID> DeduplicationEngine::FindExactDuplicate(const std::string& owner,
                                                                const std::string& content_hash) const {
    return store_->FindByContentHash(owner, content_hash);
}

std::vector<DeduplicationEngine::Duplicate> DeduplicationEngine::FindSemanticDuplicates(
        const std::string& owner,
        const Embedding& embedding,
        std::optional<float> threshold,
        const std::optional<RecordID>& exclude) const {

    std::vector<Duplicate> duplicates;
    if (embedding.empty()) {
        return duplicates;
    }

    float min_similarity = threshold.value_or(config_.similarity_threshold);

    RecordFilter filter;
    filter.owner = owner;
    filter.include_archived = false;

    // One extra neighbour because the query record usually finds itself
    auto neighbours = store_->VectorTopK(embedding, config_.candidate_limit + 1, filter);
    for (const auto& neighbour : neighbours) {
        if (exclude && neighbour.id == *exclude) {
            continue;
        }
        if (neighbour.score >= min_similarity) {
            duplicates.push_back(Duplicate{neighbour.id, neighbour.score});
        }
    }

    std::sort(duplicates.begin(), duplicates.end(), [](const Duplicate& a, const Duplicate& b) {
        if (a.similarity != b.similarity) return a.similarity > b.similarity;
        return a.id < b.id;
    });
    if (duplicates.size() > config_.candidate_limit) {
        duplicates.resize(config_.candidate_limit);
    }
    return duplicates;
}

DeduplicationEngine::MergePlan DeduplicationEngine::PlanMerge(const MemoryRecord& a,
                                                              const MemoryRecord& b,
                                                              Timestamp now) {
    if (a.GetID() == b.GetID()) {
        throw ValidationError("Cannot merge record " + a.GetID().value() + " with itself");
    }
    if (a.GetOwner() != b.GetOwner()) {
        throw ValidationError("Cannot merge records of different owners");
    }

    // Keep the more important record; ties go to usage, then to the smaller id
    bool a_survives;
    if (a.GetImportance() != b.GetImportance()) {
        a_survives = a.GetImportance() > b.GetImportance();
    } else if (a.GetAccessCount() != b.GetAccessCount()) {
        a_survives = a.GetAccessCount() > b.GetAccessCount();
    } else {
        a_survives = a.GetID() < b.GetID();
    }

    const MemoryRecord& survivor = a_survives ? a : b;
    const MemoryRecord& discarded = a_survives ? b : a;

    MergePlan plan;
    plan.survivor_id = survivor.GetID();
    plan.discarded_id = discarded.GetID();
    plan.merged = survivor;

    MemoryRecord& merged = plan.merged;
    merged.AddTags(discarded.GetTags());

    for (const auto& [key, value] : discarded.GetMetadata()) {
        if (merged.GetMetadata().count(key) == 0) {
            merged.SetMetadataValue(key, value);
        }
    }

    merged.IncrementAccessCount(discarded.GetAccessCount(), discarded.GetLastAccessed());

    if (static_cast<int>(discarded.GetTier()) > static_cast<int>(merged.GetTier())) {
        merged.AdvanceTier(discarded.GetTier(), now);
    }

    if (merged.GetSummary().empty() && !discarded.GetSummary().empty()) {
        merged.SetSummary(discarded.GetSummary());
    }

    auto it = merged.GetMetadata().find(kMergedFromKey);
    std::string merged_from = it == merged.GetMetadata().end()
                                  ? discarded.GetID().value()
                                  : it->second + "," + discarded.GetID().value();
    merged.SetMetadataValue(kMergedFromKey, merged_from);

    merged.Touch(now);
    return plan;
}

RecordID DeduplicationEngine::ResolveAlias(const RecordID& id) const {
    RecordID current = id;
    for (size_t hop = 0; hop <= config_.max_alias_hops; ++hop) {
        auto next = store_->GetTombstone(current);
        if (!next) {
            return current;
        }
        current = *next;
    }
    throw CorruptedState("Tombstone chain from " + id.value() + " exceeds " +
                         std::to_string(config_.max_alias_hops) + " hops");
}

} // namespace engram
