// File: src/storage/memory_store.hpp
#pragma once

#include "core/memory_record.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Storage statistics for monitoring
struct StorageStats {
    /// Live records (archived included)
    size_t total_records{0};

    /// Tombstoned identifiers
    size_t total_tombstones{0};

    /// Entities and relations in the graph
    size_t total_entities{0};
    size_t total_relations{0};

    /// Total disk usage in bytes (persistent backends only)
    size_t disk_usage_bytes{0};
};

/// Filter applied inside the store, before any top-K cut
struct RecordFilter {
    /// Restrict to one owner
    std::optional<std::string> owner;

    /// Restrict to one tier
    std::optional<MemoryTier> tier;

    /// Restrict to any of these tiers (empty means every tier)
    std::vector<MemoryTier> tiers;

    /// Record must carry all of these tags
    std::vector<std::string> required_tags;

    std::optional<Timestamp> created_after;   ///< Inclusive
    std::optional<Timestamp> created_before;  ///< Exclusive

    /// Whether archived records are visible
    bool include_archived{false};

    /// True when Matches needs more than owner, tier and archived state
    bool HasRecordPredicates() const {
        return !tiers.empty() || !required_tags.empty() || created_after || created_before;
    }

    bool Matches(const MemoryRecord& record) const {
        if (owner && record.GetOwner() != *owner) return false;
        if (tier && record.GetTier() != *tier) return false;
        if (!include_archived && record.IsArchived()) return false;
        if (!tiers.empty() &&
            std::find(tiers.begin(), tiers.end(), record.GetTier()) == tiers.end()) {
            return false;
        }
        for (const auto& tag : required_tags) {
            if (record.GetTags().count(tag) == 0) return false;
        }
        if (created_after && record.GetCreatedAt() < *created_after) return false;
        if (created_before && record.GetCreatedAt() >= *created_before) return false;
        return true;
    }
};

/// Keyset pagination request: records with id > after, ordered by id
struct PageRequest {
    RecordFilter filter;
    std::optional<RecordID> after;
    size_t limit{500};
};

/// One page of records
struct RecordPage {
    std::vector<MemoryRecord> records;

    /// Set when more records may follow; pass back as PageRequest::after
    std::optional<RecordID> next_after;
};

/// A record id with a signal-specific score (higher is better)
struct ScoredID {
    RecordID id;
    float score{0.0f};
};

/// Outcome of an idempotent content upsert
struct UpsertResult {
    RecordID id;
    bool created{false};
    uint32_t access_count{0};
    uint64_t version{0};
};

/// Typed entity in the knowledge graph
struct EntityNode {
    EntityID id;
    std::string label;
    std::string type;
};

/// Typed, weighted, bi-temporal relation between two entities
struct RelationEdge {
    std::string id;
    EntityID source;
    EntityID target;
    std::string relation_type;
    float weight{1.0f};
    Timestamp valid_from;
    std::optional<Timestamp> valid_to;
    Timestamp recorded_at;

    /// True when the fact held at time `t`
    bool IsValidAt(Timestamp t) const {
        if (t < valid_from) return false;
        return !valid_to || t < *valid_to;
    }
};

/// A record mentioning an entity
struct EntityMention {
    EntityID entity;
    RecordID record;
};

/// Abstract interface for memory storage backends
///
/// The store knows nothing about lifecycle rules. It offers point reads,
/// keyset pagination, version-checked writes, top-K searches and a small
/// entity graph. Every value reaches the backend as a typed parameter.
///
/// Thread Safety: All methods must be thread-safe.
///
/// Errors: a backend that cannot be reached or fails a query throws
/// UpstreamUnavailable; unreadable stored data throws CorruptedState.
class MemoryStore {
public:
    virtual ~MemoryStore() = default;

    // ========================================================================
    // Records
    // ========================================================================

    /// Insert `candidate`, or, when a record with the same (owner, content hash)
    /// exists, increment its access count, refresh its last-accessed time and
    /// union the candidate's tags into it. Atomic with respect to other callers.
    virtual UpsertResult UpsertByContent(const MemoryRecord& candidate) = 0;

    /// Retrieve a record by id
    virtual std::optional<MemoryRecord> Get(const RecordID& id) = 0;

    /// Find the record holding this content for this owner
    virtual std::optional<RecordID> FindByContentHash(const std::string& owner,
                                                      const std::string& content_hash) = 0;

    /// Compare-and-swap write. Stores `record` with version expected_version + 1
    /// if the stored version equals expected_version.
    /// @return false if the record is missing or its version moved on
    virtual bool UpdateIfVersion(const MemoryRecord& record, uint64_t expected_version) = 0;

    /// Delete a record together with its entity mentions
    virtual bool Delete(const RecordID& id) = 0;

    /// Page through records ordered by id
    virtual RecordPage ListPage(const PageRequest& request) = 0;

    /// Number of records matching a filter
    virtual size_t Count(const RecordFilter& filter) const = 0;

    // ========================================================================
    // Search
    // ========================================================================

    /// Exact cosine top-K over embedded records
    /// @throws DimensionMismatch when a stored embedding has another length
    virtual std::vector<ScoredID> VectorTopK(const Embedding& query, size_t k,
                                             const RecordFilter& filter) = 0;

    /// Keyword top-K over record content
    virtual std::vector<ScoredID> KeywordTopK(const std::string& query, size_t k,
                                              const RecordFilter& filter) = 0;

    // ========================================================================
    // Tombstones
    // ========================================================================

    /// Map a discarded id to the id that replaced it
    virtual void PutTombstone(const RecordID& discarded, const RecordID& survivor) = 0;

    /// Direct replacement of a discarded id (one hop)
    virtual std::optional<RecordID> GetTombstone(const RecordID& discarded) = 0;

    // ========================================================================
    // Cursors (consolidation progress)
    // ========================================================================

    virtual void SaveCursor(const std::string& name, const RecordID& after) = 0;
    virtual std::optional<RecordID> LoadCursor(const std::string& name) = 0;
    virtual void ClearCursor(const std::string& name) = 0;

    // ========================================================================
    // Graph
    // ========================================================================

    virtual void UpsertEntity(const EntityNode& entity) = 0;
    virtual void UpsertRelation(const RelationEdge& relation) = 0;
    virtual void LinkRecordEntity(const RecordID& record, const EntityID& entity) = 0;

    /// Entities whose label occurs in `text` (case-insensitive), longest label first
    virtual std::vector<EntityNode> FindEntitiesInText(const std::string& text, size_t limit) = 0;

    /// Relations touching `entity` in either direction that are valid at `at`
    virtual std::vector<RelationEdge> GetRelations(const EntityID& entity, Timestamp at) = 0;

    /// Records mentioning any of the entities
    virtual std::vector<EntityMention> RecordsForEntities(const std::vector<EntityID>& entities) = 0;

    /// Entities a record mentions
    virtual std::vector<EntityID> EntitiesForRecord(const RecordID& record) = 0;

    // ========================================================================
    // Maintenance
    // ========================================================================

    virtual StorageStats GetStats() const = 0;

    /// Flush pending writes (no-op for in-memory backends)
    virtual void Flush() = 0;

    /// Remove everything
    /// WARNING: This operation cannot be undone
    virtual void Clear() = 0;
};

} // namespace engram
