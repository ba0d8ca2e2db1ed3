// File: src/storage/persistent_backend.hpp
#pragma once

#include "core/debug_log.hpp"
#include "storage/memory_store.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace engram {

/// Persistent storage backend using SQLite
///
/// Records are stored as serialized blobs next to the columns the store
/// filters on (owner, content hash, tier, archived, version). Features:
/// - Durable writes with WAL (Write-Ahead Logging)
/// - UNIQUE(owner, content_hash) with an upsert inside BEGIN IMMEDIATE,
///   so identical ingests from several processes still converge
/// - Version-checked UPDATE for compare-and-swap writes
/// - FTS5 index for keyword search (BM25 ranking)
/// - Entity graph tables with bi-temporal relations
/// - Snapshot via the SQLite backup API
///
/// Every value is bound with sqlite3_bind_*; no SQL text is built from data.
class PersistentBackend : public MemoryStore {
public:
    /// Configuration for PersistentBackend
    struct Config {
        /// Path to the SQLite database file
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Cache size in KB (default: 10MB)
        size_t cache_size_kb{10240};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// How long a writer waits on a locked database
        int busy_timeout_ms{5000};
    };

    /// Construct PersistentBackend with configuration
    /// @throws std::runtime_error if database cannot be opened
    explicit PersistentBackend(const Config& config);

    /// Destructor - closes database connection
    ~PersistentBackend() override;

    // Prevent copying (SQLite connection is not copyable)
    PersistentBackend(const PersistentBackend&) = delete;
    PersistentBackend& operator=(const PersistentBackend&) = delete;

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
    void Flush() override;
    void Clear() override;

    /// Copy the whole database to `path` with the backup API
    /// @return true if snapshot created successfully
    bool CreateSnapshot(const std::string& path);

    /// Whether the FTS5 keyword index could be created
    bool HasKeywordIndex() const { return fts_available_; }

    /// Set output stream for log messages
    void SetLogStream(std::ostream* os) { log_.SetStream(os); }

private:
    // Configuration
    Config config_;

    // SQLite database handle
    sqlite3* db_{nullptr};

    // One connection, one statement at a time
    mutable std::mutex mutex_;

    bool fts_available_{false};

    DebugLog log_{"PersistentBackend"};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Initialize database schema and settings
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute a statement without parameters; false on error
    bool ExecuteSQL(const std::string& sql);

    /// Execute a statement without parameters; throws UpstreamUnavailable on error
    void ExecuteOrThrow(const std::string& sql);

    /// Count rows of a table (caller holds the mutex)
    size_t CountTableUnlocked(const char* sql) const;

    /// Serialize a MemoryRecord to binary blob
    static std::string SerializeRecord(const MemoryRecord& record);

    /// Deserialize a MemoryRecord from binary blob
    static MemoryRecord DeserializeRecord(const void* data, int size);

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;
};

} // namespace engram
