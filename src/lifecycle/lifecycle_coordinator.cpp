// File: src/lifecycle/lifecycle_coordinator.cpp
//
// Implementation of Lifecycle Coordinator

#include "lifecycle/lifecycle_coordinator.hpp"
#include "core/errors.hpp"
#include "util/text.hpp"
#include <cmath>
#include <stdexcept>

namespace engram {

LifecycleCoordinator::LifecycleCoordinator(std::shared_ptr<MemoryStore> store,
                                           std::shared_ptr<ILanguageModel> llm,
                                           const Config& config)
    : store_(std::move(store)),
      llm_(std::move(llm)),
      config_(config),
      scoring_(config.scoring),
      record_locks_(config.lock_stripes),
      ingest_locks_(config.lock_stripes) {
    if (!store_) {
        throw std::invalid_argument("LifecycleCoordinator requires a store");
    }
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid LifecycleCoordinator configuration");
    }
    if (llm_ && llm_->Dimension() != config_.embedding_dimension) {
        throw std::invalid_argument("Language model dimension " + std::to_string(llm_->Dimension()) +
                                    " differs from the configured embedding dimension " +
                                    std::to_string(config_.embedding_dimension));
    }

    dedup_ = std::make_shared<DeduplicationEngine>(store_, config_.dedup);
    retriever_ = std::make_unique<HybridRetriever>(store_, llm_, config_.retrieval);
    scheduler_ = std::make_unique<ConsolidationScheduler>(store_, dedup_, this, config_.consolidation);
}

LifecycleCoordinator::~LifecycleCoordinator() {
    if (scheduler_) {
        scheduler_->Stop();
    }
}

std::string LifecycleCoordinator::IngestKey(const std::string& owner, const std::string& content_hash) {
    return owner + '\n' + content_hash;
}

// ============================================================================
// Locked read-modify-write
// ============================================================================

MemoryRecord LifecycleCoordinator::LoadVerified(const RecordID& id) {
    auto record = store_->Get(id);
    if (!record) {
        throw NotFoundError("Record not found: " + id.value());
    }
    record->VerifyIntegrity();
    return std::move(*record);
}

template <typename Fn>
MemoryRecord LifecycleCoordinator::MutateRecord(const RecordID& id, Fn&& mutate) {
    auto lock = record_locks_.Lock(id.value());

    // Ingest bumps versions without this lock, so a write can still lose
    for (int attempt = 0; attempt < kMaxWriteAttempts; ++attempt) {
        MemoryRecord record = LoadVerified(id);
        const uint64_t version = record.GetVersion();

        if (!mutate(record)) {
            return record;
        }
        if (store_->UpdateIfVersion(record, version)) {
            record.SetVersion(version + 1);
            return record;
        }
        log_.Debug("version conflict on " + id.value() + ", retrying");
    }
    throw InvalidRecordState("Record " + id.value() + " kept changing during update");
}

// ============================================================================
// Records
// ============================================================================

RecordID LifecycleCoordinator::Ingest(const std::string& content,
                                      const std::string& owner,
                                      const MemoryRecord::TagSet& tags,
                                      const IngestOptions& options) {
    if (content.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Cannot ingest empty content");
    }
    if (owner.empty()) {
        throw ValidationError("Cannot ingest without an owner");
    }
    if (content.size() > config_.max_content_bytes) {
        throw ValidationError("Content of " + std::to_string(content.size()) +
                              " bytes exceeds the limit of " +
                              std::to_string(config_.max_content_bytes));
    }

    const Timestamp now = Timestamp::Now();
    MemoryRecord candidate(RecordID::Generate(), owner, content, options.tier, now);

    float importance = options.importance.value_or(config_.default_importance);
    if (std::isnan(importance)) {
        throw ValidationError("Importance must be a number");
    }
    candidate.SetImportance(importance);
    candidate.SetDecayWeight(candidate.GetImportance());
    candidate.AddTags(tags);
    for (const auto& [key, value] : options.metadata) {
        candidate.SetMetadataValue(key, value);
    }
    candidate.RecordAccess(now);

    // Embedded before the write so a bad vector leaves the store untouched
    if (llm_ && options.embed.value_or(config_.embed_on_ingest)) {
        candidate.SetEmbedding(EmbedChecked(content));
    }

    UpsertResult result;
    {
        auto lock = ingest_locks_.Lock(IngestKey(owner, candidate.GetContentHash()));
        result = store_->UpsertByContent(candidate);
    }

    if (result.created) {
        log_.Debug("ingested " + result.id.value() + " for " + owner);
    } else {
        log_.Debug("content already held by " + result.id.value() + ", access count now " +
                   std::to_string(result.access_count));
    }

    if (result.created) {
        RecordFilter filter;
        filter.tier = options.tier;
        scheduler_->NotifyTierSize(options.tier, store_->Count(filter));
    }

    return result.id;
}

Embedding LifecycleCoordinator::EmbedChecked(const std::string& content) {
    Embedding embedding = llm_->Embed(content);
    if (embedding.size() != config_.embedding_dimension) {
        throw DimensionMismatch(config_.embedding_dimension, embedding.size());
    }
    return embedding;
}

MemoryRecord LifecycleCoordinator::Get(const RecordID& id) {
    return LoadVerified(ResolveId(id));
}

RecordID LifecycleCoordinator::ResolveId(const RecordID& id) const {
    return dedup_->ResolveAlias(id);
}

MemoryRecord LifecycleCoordinator::Promote(const RecordID& id) {
    const Timestamp now = Timestamp::Now();
    return MutateRecord(ResolveId(id), [&](MemoryRecord& record) {
        if (record.IsArchived()) {
            throw InvalidRecordState("Cannot promote archived record " + record.GetID().value());
        }
        auto next = NextTier(record.GetTier());
        if (!next) {
            throw InvalidRecordState("Record " + record.GetID().value() + " is already in " +
                                     ToString(record.GetTier()));
        }
        record.AdvanceTier(*next, now);
        return true;
    });
}

MemoryRecord LifecycleCoordinator::Archive(const RecordID& id) {
    const Timestamp now = Timestamp::Now();
    return MutateRecord(ResolveId(id), [&](MemoryRecord& record) {
        if (record.IsArchived()) {
            return false;
        }
        record.MarkArchived(now);
        return true;
    });
}

MemoryRecord LifecycleCoordinator::RecordAccess(const RecordID& id) {
    const Timestamp now = Timestamp::Now();
    return MutateRecord(ResolveId(id), [&](MemoryRecord& record) {
        record.RecordAccess(now);
        return true;
    });
}

// ============================================================================
// Retrieval
// ============================================================================

SearchResult LifecycleCoordinator::Search(const SearchRequest& request) {
    SearchResult result = retriever_->Search(request);

    if (config_.record_access_on_search) {
        for (auto& item : result.items) {
            try {
                item.record = RecordAccess(item.id);
            } catch (const NotFoundError&) {
                // Merged away after ranking; the copy in the result stays valid
                log_.Debug("record " + item.id.value() + " vanished before its access was counted");
            }
        }
    }
    return result;
}

// ============================================================================
// Entity graph
// ============================================================================

void LifecycleCoordinator::LinkEntity(const RecordID& record, const EntityNode& entity) {
    if (entity.id.empty() || entity.label.empty()) {
        throw ValidationError("Entity needs an id and a label");
    }
    RecordID resolved = ResolveId(record);
    auto lock = record_locks_.Lock(resolved.value());
    LoadVerified(resolved);

    store_->UpsertEntity(entity);
    store_->LinkRecordEntity(resolved, entity.id);
}

void LifecycleCoordinator::AddRelation(const RelationEdge& relation) {
    if (relation.id.empty() || relation.source.empty() || relation.target.empty()) {
        throw ValidationError("Relation needs an id, a source and a target");
    }
    if (std::isnan(relation.weight) || relation.weight < 0.0f) {
        throw ValidationError("Relation weight must be non-negative");
    }
    if (relation.valid_to && !(relation.valid_from < *relation.valid_to)) {
        throw ValidationError("Relation " + relation.id + " has an empty validity window");
    }
    store_->UpsertRelation(relation);
}

// ============================================================================
// Consolidation
// ============================================================================

std::vector<ConsolidationJob> LifecycleCoordinator::RunConsolidationTick() {
    return scheduler_->RunTick();
}

std::vector<ConsolidationJob> LifecycleCoordinator::RunConsolidationTick(Timestamp now) {
    return scheduler_->RunTick(now);
}

bool LifecycleCoordinator::AttachEmbedding(const RecordID& id) {
    if (!llm_) {
        return false;
    }

    MemoryRecord current = LoadVerified(id);
    if (current.HasEmbedding()) {
        return false;
    }

    // The model call stays outside the record lock
    Embedding embedding = EmbedChecked(current.GetContent());

    bool attached = false;
    MutateRecord(id, [&](MemoryRecord& record) {
        if (record.HasEmbedding()) {
            return false;
        }
        record.SetEmbedding(embedding);
        attached = true;
        return true;
    });
    return attached;
}

bool LifecycleCoordinator::AttachSummary(const RecordID& id) {
    if (!llm_) {
        return false;
    }

    MemoryRecord current = LoadVerified(id);
    if (!current.GetSummary().empty()) {
        return false;
    }

    std::string summary = llm_->Summarize({current.GetContent()});

    bool attached = false;
    MutateRecord(id, [&](MemoryRecord& record) {
        if (!record.GetSummary().empty()) {
            return false;
        }
        record.SetSummary(summary);
        attached = true;
        return true;
    });
    return attached;
}

bool LifecycleCoordinator::AttachKeywordTags(const RecordID& id, size_t max_tags) {
    bool attached = false;
    MutateRecord(id, [&](MemoryRecord& record) {
        if (!record.GetTags().empty()) {
            return false;
        }
        auto keywords = text::TopKeywords(record.GetContent(), max_tags);
        if (keywords.empty()) {
            return false;
        }
        record.AddTags(MemoryRecord::TagSet(keywords.begin(), keywords.end()));
        attached = true;
        return true;
    });
    return attached;
}

void LifecycleCoordinator::ApplyScore(const RecordID& id, Timestamp now) {
    MutateRecord(id, [&](MemoryRecord& record) {
        ScoreResult score = scoring_.Score(record, now);
        if (score.decay_weight == record.GetDecayWeight()) {
            return false;
        }
        record.SetDecayWeight(score.decay_weight);
        return true;
    });
}

bool LifecycleCoordinator::PromoteIfEligible(const RecordID& id, Timestamp now) {
    bool promoted = false;
    MutateRecord(id, [&](MemoryRecord& record) {
        if (!scoring_.ShouldPromote(record, now)) {
            return false;
        }
        auto next = NextTier(record.GetTier());
        record.AdvanceTier(*next, now);
        promoted = true;
        return true;
    });
    if (promoted) {
        log_.Debug("promoted " + id.value());
    }
    return promoted;
}

bool LifecycleCoordinator::ArchiveIfEligible(const RecordID& id, Timestamp now) {
    bool archived = false;
    MutateRecord(id, [&](MemoryRecord& record) {
        if (!scoring_.ShouldArchive(record, now)) {
            return false;
        }
        record.MarkArchived(now);
        archived = true;
        return true;
    });
    if (archived) {
        log_.Debug("archived " + id.value());
    }
    return archived;
}

RecordID LifecycleCoordinator::Merge(const RecordID& a, const RecordID& b, Timestamp now) {
    if (a == b) {
        throw ValidationError("Cannot merge record " + a.value() + " with itself");
    }

    auto record_lock = record_locks_.LockPair(a.value(), b.value());

    MemoryRecord first = LoadVerified(a);
    MemoryRecord second = LoadVerified(b);

    // Hold off ingests of either content so no access increment is lost
    auto ingest_lock = ingest_locks_.LockPair(IngestKey(first.GetOwner(), first.GetContentHash()),
                                              IngestKey(second.GetOwner(), second.GetContentHash()));
    first = LoadVerified(a);
    second = LoadVerified(b);

    auto plan = DeduplicationEngine::PlanMerge(first, second, now);
    const MemoryRecord& survivor = plan.survivor_id == a ? first : second;

    if (!store_->UpdateIfVersion(plan.merged, survivor.GetVersion())) {
        throw InvalidRecordState("Record " + plan.survivor_id.value() + " changed during merge");
    }

    // Tombstone before delete so the old id always resolves
    store_->PutTombstone(plan.discarded_id, plan.survivor_id);
    for (const auto& entity : store_->EntitiesForRecord(plan.discarded_id)) {
        store_->LinkRecordEntity(plan.survivor_id, entity);
    }
    if (!store_->Delete(plan.discarded_id)) {
        log_.Warning("merged record " + plan.discarded_id.value() + " was already gone");
    }

    log_.Debug("merged " + plan.discarded_id.value() + " into " + plan.survivor_id.value());
    return plan.survivor_id;
}

std::optional<RecordID> LifecycleCoordinator::ConsolidateGroup(const std::vector<RecordID>& members,
                                                               Timestamp now) {
    if (!llm_) {
        return std::nullopt;
    }

    std::vector<MemoryRecord> live;
    for (const auto& id : members) {
        auto record = store_->Get(id);
        if (!record || record->IsArchived()) {
            continue;
        }
        record->VerifyIntegrity();
        if (!live.empty() && record->GetOwner() != live.front().GetOwner()) {
            throw ValidationError("Cannot consolidate records of " + live.front().GetOwner() +
                                  " and " + record->GetOwner());
        }
        live.push_back(std::move(*record));
    }
    if (live.size() < 2) {
        return std::nullopt;
    }

    std::vector<std::string> contents;
    MemoryRecord::TagSet tags;
    std::string sources;
    for (const auto& record : live) {
        contents.push_back(record.GetContent());
        tags.insert(record.GetTags().begin(), record.GetTags().end());
        sources += (sources.empty() ? "" : ",") + record.GetID().value();
    }

    std::string summary = llm_->Summarize(contents);

    IngestOptions options;
    options.tier = MemoryTier::LONG_TERM;
    options.importance = config_.group_summary_importance;
    options.metadata["consolidated_from"] = sources;
    options.embed = true;
    RecordID summary_id = Ingest(summary, live.front().GetOwner(), tags, options);

    for (const auto& record : live) {
        const RecordID& id = record.GetID();
        if (id == summary_id) {
            continue;
        }
        try {
            MutateRecord(id, [&](MemoryRecord& current) {
                current.SetMetadataValue("consolidated_into", summary_id.value());
                if (!current.IsArchived()) {
                    current.MarkArchived(now);
                }
                return true;
            });
        } catch (const NotFoundError&) {
            log_.Debug("group member " + id.value() + " disappeared before archiving");
        }
    }

    log_.Debug("consolidated " + std::to_string(live.size()) + " records into " + summary_id.value());
    return summary_id;
}

// ============================================================================
// Logging
// ============================================================================

void LifecycleCoordinator::SetLogStream(std::ostream* os) {
    log_.SetStream(os);
    retriever_->SetLogStream(os);
    scheduler_->SetLogStream(os);
}

void LifecycleCoordinator::SetDebugEnabled(bool enabled) {
    log_.SetDebugEnabled(enabled);
    retriever_->SetDebugEnabled(enabled);
    scheduler_->SetDebugEnabled(enabled);
}

} // namespace engram
