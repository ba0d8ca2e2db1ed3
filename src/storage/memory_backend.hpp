// File: src/storage/memory_backend.hpp
#pragma once

#include "storage/memory_store.hpp"
#include <map>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace engram {

/// In-memory storage backend
///
/// Records live in an ordered map so keyset pagination is a lower_bound.
/// Thread-safe with shared_mutex (multiple readers, single writer); the
/// content upsert runs entirely under the exclusive lock, which makes it
/// atomic with respect to every other caller in the process.
///
/// Keyword search is an Okapi BM25 scan over record content.
class MemoryBackend : public MemoryStore {
public:
    /// Configuration for MemoryBackend
    struct Config {
        /// BM25 term-frequency saturation
        float bm25_k1{1.2f};

        /// BM25 length normalization
        float bm25_b{0.75f};
    };

    MemoryBackend();
    explicit MemoryBackend(const Config& config);
    ~MemoryBackend() override = default;

    // ========================================================================
    // MemoryStore Interface Implementation
    // ========================================================================

    UpsertResult UpsertByContent(const MemoryRecord& candidate) override;
    std::optional<MemoryRecord> Get(const RecordID& id) override;
    std::optional<RecordID> FindByContentHash(const std::string& owner,
                                              const std::string& content_hash) override;
    bool UpdateIfVersion(const MemoryRecord& record, uint64_t expected_version) override;
    bool Delete(const RecordID& id) override;
    RecordPage ListPage(const PageRequest& request) override;
    size_t Count(const RecordFilter& filter) const override;

    std::vector<ScoredID> VectorTopK(const Embedding& query, size_t k,
                                     const RecordFilter& filter) override;
    std::vector<ScoredID> KeywordTopK(const std::string& query, size_t k,
                                      const RecordFilter& filter) override;

    void PutTombstone(const RecordID& discarded, const RecordID& survivor) override;
    std::optional<RecordID> GetTombstone(const RecordID& discarded) override;

    void SaveCursor(const std::string& name, const RecordID& after) override;
    std::optional<RecordID> LoadCursor(const std::string& name) override;
    void ClearCursor(const std::string& name) override;

    void UpsertEntity(const EntityNode& entity) override;
    void UpsertRelation(const RelationEdge& relation) override;
    void LinkRecordEntity(const RecordID& record, const EntityID& entity) override;
    std::vector<EntityNode> FindEntitiesInText(const std::string& text, size_t limit) override;
    std::vector<RelationEdge> GetRelations(const EntityID& entity, Timestamp at) override;
    std::vector<EntityMention> RecordsForEntities(const std::vector<EntityID>& entities) override;
    std::vector<EntityID> EntitiesForRecord(const RecordID& record) override;

    StorageStats GetStats() const override;
    void Flush() override {}
    void Clear() override;

private:
    using HashKey = std::pair<std::string, std::string>;  // (owner, content hash)

    Config config_;

    // Thread synchronization (shared_mutex allows multiple readers, single writer)
    mutable std::shared_mutex mutex_;

    // Records ordered by id
    std::map<RecordID, MemoryRecord> records_;

    // Uniqueness index for idempotent ingest
    std::map<HashKey, RecordID> hash_index_;

    std::unordered_map<RecordID, RecordID> tombstones_;
    std::unordered_map<std::string, RecordID> cursors_;

    // Graph
    std::map<EntityID, EntityNode> entities_;
    std::map<std::string, RelationEdge> relations_;
    std::multimap<EntityID, RecordID> mentions_by_entity_;
    std::multimap<RecordID, EntityID> mentions_by_record_;

    /// Drop both sides of a record's mentions; caller holds the exclusive lock
    void UnlinkRecordUnlocked(const RecordID& id);
};

} // namespace engram
