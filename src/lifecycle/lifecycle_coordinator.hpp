// File: src/lifecycle/lifecycle_coordinator.hpp
#pragma once

#include "core/debug_log.hpp"
#include "core/memory_record.hpp"
#include "core/types.hpp"
#include "lifecycle/record_lock_table.hpp"
#include "llm/language_model.hpp"
#include "memory/consolidation_scheduler.hpp"
#include "memory/deduplication_engine.hpp"
#include "memory/scoring_engine.hpp"
#include "retrieval/hybrid_retriever.hpp"
#include "storage/memory_store.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Per-call ingest options
struct IngestOptions {
    MemoryTier tier{MemoryTier::WORKING};
    std::optional<float> importance;   ///< Coordinator default when unset
    Metadata metadata;

    /// Embed synchronously; coordinator default when unset
    std::optional<bool> embed;
};

/**
 * @brief Single entry point for every record mutation
 *
 * The coordinator owns the rules that must hold across components:
 * - ingest is an idempotent upsert keyed by (owner, content hash)
 * - every mutation runs under the record's lock and is written with a
 *   version check, retried when a concurrent ingest bumped the version
 * - a merge locks both ids in order, writes the survivor, tombstones the
 *   loser and moves its entity links across
 *
 * It also serves as the consolidation scheduler's RecordMutator, so
 * background work and explicit calls go through the same code.
 */
class LifecycleCoordinator : public RecordMutator {
public:
    /**
     * @brief Configuration for the coordinator and the components it owns
     */
    struct Config {
        ScoringEngine::Config scoring;
        DeduplicationEngine::Config dedup;
        HybridRetriever::Config retrieval;
        ConsolidationScheduler::Config consolidation;

        size_t embedding_dimension{256};     ///< Length of every stored embedding
        bool embed_on_ingest{false};         ///< Otherwise the tick embeds
        float default_importance{0.5f};
        float group_summary_importance{0.8f};  ///< Importance of a consolidated group's summary
        size_t max_content_bytes{1 << 20};
        bool record_access_on_search{true};  ///< Returned records count as accessed
        size_t lock_stripes{64};

        bool IsValid() const {
            return scoring.IsValid() &&
                   dedup.IsValid() &&
                   retrieval.IsValid() &&
                   consolidation.IsValid() &&
                   embedding_dimension > 0 &&
                   default_importance >= 0.0f && default_importance <= 1.0f &&
                   group_summary_importance >= 0.0f && group_summary_importance <= 1.0f &&
                   max_content_bytes > 0 &&
                   lock_stripes > 0;
        }
    };

    /**
     * @param llm May be null; embeddings, summaries and the vector signal are then skipped
     * @throws std::invalid_argument if store is null, config invalid or the
     *         model's dimension differs from embedding_dimension
     */
    LifecycleCoordinator(std::shared_ptr<MemoryStore> store,
                         std::shared_ptr<ILanguageModel> llm,
                         const Config& config);

    /// Destructor - stops background consolidation
    ~LifecycleCoordinator() override;

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    // ========================================================================
    // Records
    // ========================================================================

    /**
     * @brief Store content for an owner
     *
     * Identical content for the same owner lands on the existing record:
     * its access count grows by one and the tags are merged in.
     *
     * @return Id of the new or existing record
     * @throws ValidationError on empty content/owner or oversized content
     * @throws DimensionMismatch when embedding synchronously and the model
     *         returns a vector of the wrong length; nothing is stored
     */
    RecordID Ingest(const std::string& content,
                    const std::string& owner,
                    const MemoryRecord::TagSet& tags = {},
                    const IngestOptions& options = {});

    /// Record by id, following merge tombstones
    /// @throws NotFoundError, CorruptedState
    MemoryRecord Get(const RecordID& id);

    /// Move a record one tier forward regardless of eligibility
    /// @throws InvalidRecordState when archived or already LONG_TERM
    MemoryRecord Promote(const RecordID& id);

    /// Archive a record (no-op when already archived)
    MemoryRecord Archive(const RecordID& id);

    /// Count an access
    MemoryRecord RecordAccess(const RecordID& id);

    /// Id that currently holds the content of `id`
    RecordID ResolveId(const RecordID& id) const;

    // ========================================================================
    // Retrieval
    // ========================================================================

    SearchResult Search(const SearchRequest& request);

    // ========================================================================
    // Entity graph
    // ========================================================================

    /// Register an entity and note that a record mentions it
    void LinkEntity(const RecordID& record, const EntityNode& entity);

    /// Add or replace a relation between two entities
    /// @throws ValidationError on empty endpoints, a negative weight or an empty validity window
    void AddRelation(const RelationEdge& relation);

    // ========================================================================
    // Consolidation
    // ========================================================================

    std::vector<ConsolidationJob> RunConsolidationTick();
    std::vector<ConsolidationJob> RunConsolidationTick(Timestamp now);

    void StartBackgroundConsolidation() { scheduler_->Start(); }
    void StopBackgroundConsolidation() { scheduler_->Stop(); }

    ConsolidationScheduler& GetScheduler() { return *scheduler_; }
    const ScoringEngine& GetScoringEngine() const { return scoring_; }

    // ========================================================================
    // RecordMutator
    // ========================================================================

    bool AttachEmbedding(const RecordID& id) override;
    bool AttachSummary(const RecordID& id) override;
    bool AttachKeywordTags(const RecordID& id, size_t max_tags) override;
    void ApplyScore(const RecordID& id, Timestamp now) override;
    bool PromoteIfEligible(const RecordID& id, Timestamp now) override;
    bool ArchiveIfEligible(const RecordID& id, Timestamp now) override;
    RecordID Merge(const RecordID& a, const RecordID& b, Timestamp now) override;

    /**
     * The summary is ingested as a LONG_TERM record carrying the member ids
     * in its "consolidated_from" metadata. Each member is then archived with
     * "consolidated_into" pointing at the summary. Members that were archived
     * or merged away in the meantime are left out.
     *
     * @throws ValidationError when the members belong to different owners
     */
    std::optional<RecordID> ConsolidateGroup(const std::vector<RecordID>& members,
                                             Timestamp now) override;

    /// Set output stream for this and every owned component
    void SetLogStream(std::ostream* os);
    void SetDebugEnabled(bool enabled);

    const Config& GetConfig() const { return config_; }

private:
    static constexpr int kMaxWriteAttempts = 8;

    std::shared_ptr<MemoryStore> store_;
    std::shared_ptr<ILanguageModel> llm_;
    Config config_;

    ScoringEngine scoring_;
    std::shared_ptr<DeduplicationEngine> dedup_;
    std::unique_ptr<HybridRetriever> retriever_;

    RecordLockTable record_locks_;
    RecordLockTable ingest_locks_;

    DebugLog log_{"LifecycleCoordinator"};

    // Declared last: its thread calls back into this object
    std::unique_ptr<ConsolidationScheduler> scheduler_;

    /// Read-modify-write under the record lock with a version check
    ///
    /// `mutate` returns false when it changed nothing; the record is then
    /// not written.
    template <typename Fn>
    MemoryRecord MutateRecord(const RecordID& id, Fn&& mutate);

    MemoryRecord LoadVerified(const RecordID& id);

    /// Embed content and check the vector length
    Embedding EmbedChecked(const std::string& content);
    static std::string IngestKey(const std::string& owner, const std::string& content_hash);
};

} // namespace engram
